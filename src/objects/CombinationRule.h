//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
// 
// You should have received a copy of the GNU Lesser General Public License
// along with this program.  If not, see http://www.gnu.org/licenses/.
// 

#ifndef OBJECTS_COMBINATIONRULE_H_
#define OBJECTS_COMBINATIONRULE_H_

#include <memory>
#include <string>
#include <vector>

#include "../common/Constants.h"
#include "AdvancedRules.h"
#include "BasicRules.h"
#include "CanonicalDecomposition.h"
#include "MassFunction.h"
#include "PCRRules.h"

namespace dsfusion {

// Abstract base class for combination rules
class CombinationRule {
public:
    virtual ~CombinationRule() = default;
    virtual std::string name() const = 0;
    virtual MassFunction combine(const MassFunction& m1, const MassFunction& m2) const = 0;

    /**
     * Combine any number of sources. Defaults to the left fold in the given
     * order; N-ary rules override it.
     */
    virtual MassFunction combineAll(const std::vector<MassFunction>& sources) const;

    // false when combineAll is not a fold of combine
    virtual bool foldable() const { return true; }
};

class DempsterRule: public CombinationRule {
public:
    std::string name() const override { return rule::DEMPSTER; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combineConjunctive(m1, m2, true);
    }
};

// unnormalized, conflict stays on the empty set
class ConjunctiveRule: public CombinationRule {
public:
    std::string name() const override { return rule::CONJUNCTIVE; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combineConjunctive(m1, m2, false);
    }
};

class DisjunctiveRule: public CombinationRule {
public:
    std::string name() const override { return rule::DISJUNCTIVE; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combineDisjunctive(m1, m2);
    }
};

class YagerRule: public CombinationRule {
public:
    std::string name() const override { return rule::YAGER; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combineYager(m1, m2);
    }
};

class DuboisPradeRule: public CombinationRule {
public:
    std::string name() const override { return rule::DUBOIS_PRADE; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combineDuboisPrade(m1, m2);
    }
};

class ZhangRule: public CombinationRule {
public:
    std::string name() const override { return rule::ZHANG; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combineZhang(m1, m2);
    }
};

class PCR5Rule: public CombinationRule {
public:
    std::string name() const override { return rule::PCR5; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combinePCR5(m1, m2);
    }
};

class PCR6Rule: public CombinationRule {
public:
    std::string name() const override { return rule::PCR6; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combinePCR6({ m1, m2 });
    }
    MassFunction combineAll(const std::vector<MassFunction>& sources) const override {
        return combinePCR6(sources);
    }
    bool foldable() const override { return false; }
};

class CautiousRule: public CombinationRule {
public:
    std::string name() const override { return rule::CAUTIOUS; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combineCautious(m1, m2);
    }
};

class BoldRule: public CombinationRule {
public:
    std::string name() const override { return rule::BOLD; }
    MassFunction combine(const MassFunction& m1, const MassFunction& m2) const override {
        return combineBold(m1, m2);
    }
};

/**
 * Look a rule up by name ("dempster", "yager", "pcr6", ...).
 * @throws ValidationError for an unknown name
 */
std::unique_ptr<CombinationRule> makeRule(const std::string& name);
std::vector<std::string> ruleNames();

}

#endif /* OBJECTS_COMBINATIONRULE_H_ */
