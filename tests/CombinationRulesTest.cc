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

#include <gtest/gtest.h>

#include "../src/common/Exceptions.h"
#include "../src/objects/AdvancedRules.h"
#include "../src/objects/BasicRules.h"
#include "../src/objects/PCRRules.h"

using namespace dsfusion;

namespace {

MassFunction m1() {
    return MassFunction::create({ { { "a" }, 0.4 }, { { "b" }, 0.2 }, { { "a", "b" }, 0.4 } });
}

MassFunction m2() {
    return MassFunction::create({ { { "a" }, 0.2 }, { { "b" }, 0.6 }, { { "a", "b" }, 0.2 } });
}

MassFunction m3() {
    return MassFunction::create({ { { "a" }, 0.8 }, { { "b" }, 0.2 } });
}

MassFunction m4() {
    return MassFunction::create({ { { "a" }, 0.1 }, { { "b" }, 0.9 } });
}

}

TEST(BasicRulesTest, DempsterNormalizesConflictAway) {
    MassFunction raw = combineConjunctive(m1(), m2(), false);
    EXPECT_NEAR(raw.mass({ "a" }), 0.24, 1e-12);
    EXPECT_NEAR(raw.mass({ "b" }), 0.4, 1e-12);
    EXPECT_NEAR(raw.mass({ "a", "b" }), 0.08, 1e-12);
    EXPECT_NEAR(raw.conflictMass(), 0.28, 1e-12);

    MassFunction result = combineConjunctive(m1(), m2());
    EXPECT_NEAR(result.mass({ "a" }), 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 5.0 / 9.0, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 1.0 / 9.0, 1e-12);
    EXPECT_NEAR(result.total(), 1.0, 1e-10);
}

TEST(AdvancedRulesTest, YagerMovesConflictToFrame) {
    MassFunction result = combineYager(m1(), m2());
    EXPECT_NEAR(result.mass({ "a" }), 0.24, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.4, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.36, 1e-12);
    EXPECT_NEAR(result.total(), 1.0, 1e-12);
}

TEST(BasicRulesTest, UnnormalizedConjunctiveKeepsConflict) {
    MassFunction result = combineConjunctive(m3(), m4(), false);
    EXPECT_NEAR(result.conflictMass(), 0.74, 1e-12);
    EXPECT_NEAR(result.mass({ "a" }), 0.08, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.18, 1e-12);
    EXPECT_NEAR(conflictBetween(m3(), m4()), 0.74, 1e-12);

    MassFunction normalized = combineConjunctive(m3(), m4());
    EXPECT_NEAR(normalized.mass({ "a" }), 0.08 / 0.26, 1e-12);
    EXPECT_NEAR(normalized.mass({ "b" }), 0.18 / 0.26, 1e-12);
}

TEST(BasicRulesTest, ConjunctiveIsCommutative) {
    EXPECT_TRUE(combineConjunctive(m1(), m2()).equals(combineConjunctive(m2(), m1())));
    EXPECT_TRUE(combineConjunctive(m3(), m4(), false)
            .equals(combineConjunctive(m4(), m3(), false)));
}

TEST(BasicRulesTest, VacuousIsNeutralForConjunctionAbsorbingForDisjunction) {
    Frame frame({ "a", "b" });
    MassFunction vacuous = MassFunction::vacuous(frame);
    EXPECT_TRUE(combineConjunctive(m1(), vacuous).equals(m1()));
    EXPECT_TRUE(combineDisjunctive(m1(), vacuous).equals(vacuous));
}

TEST(BasicRulesTest, DisjunctiveIsNormalized) {
    MassFunction result = combineDisjunctive(m3(), m4());
    EXPECT_DOUBLE_EQ(result.conflictMass(), 0.0);
    EXPECT_NEAR(result.total(), 1.0, 1e-12);
    EXPECT_NEAR(result.mass({ "a" }), 0.08, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.18, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.74, 1e-12);
}

TEST(BasicRulesTest, TotalConflictIsReported) {
    MassFunction a = MassFunction::create({ { { "a" }, 1.0 } });
    MassFunction b = MassFunction::create({ { { "b" }, 1.0 } });
    EXPECT_THROW(combineConjunctive(a, b), TotalConflict);

    MassFunction raw = combineConjunctive(a, b, false);
    EXPECT_DOUBLE_EQ(raw.conflictMass(), 1.0);
}

TEST(BasicRulesTest, ExplicitFramesMustMatch) {
    MassFunction left = MassFunction::create({ { { "a" }, 1.0 } }, Frame({ "a", "b" }));
    MassFunction right = MassFunction::create({ { { "a" }, 1.0 } }, Frame({ "a", "b", "c" }));
    EXPECT_THROW(combineConjunctive(left, right), FrameMismatch);
    EXPECT_THROW(combineDisjunctive(left, right), FrameMismatch);
}

TEST(BasicRulesTest, ResultFrameFollowsOperands) {
    MassFunction declared = MassFunction::create({ { { "a" }, 0.5 }, { { "a", "b" }, 0.5 } },
            Frame({ "a", "b", "c" }));
    MassFunction result = combineConjunctive(m1(), declared);
    EXPECT_TRUE(result.hasExplicitFrame());
    EXPECT_EQ(result.frame(), Frame({ "a", "b", "c" }));

    MassFunction c = MassFunction::create({ { { "b" }, 0.5 }, { { "b", "c" }, 0.5 } });
    MassFunction inferred = combineDisjunctive(m3(), c);
    EXPECT_FALSE(inferred.hasExplicitFrame());
    EXPECT_EQ(inferred.frame(), Frame({ "a", "b", "c" }));
}

TEST(BasicRulesTest, CombineMultipleFoldsLeftToRight) {
    MassFunction m5 = MassFunction::create({ { { "a" }, 0.5 }, { { "a", "b" }, 0.5 } });
    std::vector<MassFunction> sources { m3(), m4(), m5 };

    MassFunction folded = combineMultiple(sources, combinePCR5);
    MassFunction manual = combinePCR5(combinePCR5(m3(), m4()), m5);
    EXPECT_TRUE(folded.equals(manual, 1e-12));

    MassFunction dempster = combineMultiple({ m1(), m2(), m3() },
            [](const MassFunction& x, const MassFunction& y) {
                return combineConjunctive(x, y);
            });
    EXPECT_TRUE(dempster.equals(combineConjunctive(combineConjunctive(m1(), m2()), m3())));
}

TEST(BasicRulesTest, CombineMultipleEdgeCases) {
    EXPECT_THROW(combineMultiple({}, combineYager), ValidationError);
    MassFunction single = combineMultiple({ m1() }, combineYager);
    EXPECT_TRUE(single.equals(m1()));
}

TEST(AdvancedRulesTest, YagerScenario) {
    MassFunction result = combineYager(m3(), m4());
    EXPECT_NEAR(result.mass({ "a" }), 0.08, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.18, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.74, 1e-12);
    EXPECT_DOUBLE_EQ(result.conflictMass(), 0.0);
}

TEST(AdvancedRulesTest, DuboisPradeScenario) {
    MassFunction result = combineDuboisPrade(m3(), m4());
    EXPECT_NEAR(result.mass({ "a" }), 0.08, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.18, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.74, 1e-12);
}

TEST(AdvancedRulesTest, YagerAndDuboisPradeDivergeOnLargerFrames) {
    Frame frame({ "a", "b", "c" });
    MassFunction left = MassFunction::create({ { { "a" }, 0.8 }, { { "a", "b", "c" }, 0.2 } }, frame);
    MassFunction right = MassFunction::create({ { { "b" }, 0.9 }, { { "a", "b", "c" }, 0.1 } }, frame);

    MassFunction yager = combineYager(left, right);
    EXPECT_NEAR(yager.mass({ "a", "b", "c" }), 0.74, 1e-12);
    EXPECT_DOUBLE_EQ(yager.mass({ "a", "b" }), 0.0);

    MassFunction duboisPrade = combineDuboisPrade(left, right);
    EXPECT_NEAR(duboisPrade.mass({ "a", "b" }), 0.72, 1e-12);
    EXPECT_NEAR(duboisPrade.mass({ "a", "b", "c" }), 0.02, 1e-12);
    EXPECT_NEAR(duboisPrade.mass({ "a" }), 0.08, 1e-12);
    EXPECT_NEAR(duboisPrade.mass({ "b" }), 0.18, 1e-12);
    EXPECT_FALSE(yager.equals(duboisPrade));
}

TEST(AdvancedRulesTest, ZhangOnSingletonsMatchesDempster) {
    // every surviving pair is {x}∩{x} with ratio 1
    MassFunction result = combineZhang(m3(), m4());
    EXPECT_NEAR(result.mass({ "a" }), 0.08 / 0.26, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.18 / 0.26, 1e-12);
    EXPECT_NEAR(result.total(), 1.0, 1e-12);
    EXPECT_TRUE(result.equals(combineConjunctive(m3(), m4()), 1e-12));
}

TEST(AdvancedRulesTest, ZhangWeighsIntersectionsBySize) {
    // {a}∩{a,b} and {a,b}∩{a,b} count with ratio 1/2
    MassFunction result = combineZhang(m1(), m2());
    EXPECT_NEAR(result.mass({ "a" }), 0.16 / 0.46, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.26 / 0.46, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.04 / 0.46, 1e-12);
    EXPECT_NEAR(result.total(), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(result.conflictMass(), 0.0);
}

TEST(AdvancedRulesTest, ZhangWithVacuousSourceKeepsTheOther) {
    MassFunction result = combineZhang(m1(), MassFunction::vacuous(Frame({ "a", "b" })));
    EXPECT_TRUE(result.equals(m1()));
}

TEST(AdvancedRulesTest, DisjointSingletons) {
    MassFunction a = MassFunction::create({ { { "a" }, 1.0 } });
    MassFunction b = MassFunction::create({ { { "b" }, 1.0 } });
    EXPECT_NEAR(combineYager(a, b).mass({ "a", "b" }), 1.0, 1e-12);
    EXPECT_NEAR(combineDuboisPrade(a, b).mass({ "a", "b" }), 1.0, 1e-12);
    // Zhang normalizes over the intersections, and none is left
    EXPECT_THROW(combineZhang(a, b), TotalConflict);
}

TEST(PCRRulesTest, PCR5Redistribution) {
    MassFunction result = combinePCR5(m3(), m4());
    EXPECT_NEAR(result.mass({ "a" }), 0.08 + 0.72 * 0.8 / 1.7 + 0.02 * 0.1 / 0.3, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.18 + 0.72 * 0.9 / 1.7 + 0.02 * 0.2 / 0.3, 1e-12);
    EXPECT_NEAR(result.total(), 1.0, 1e-12);
}

TEST(PCRRulesTest, PCR6MatchesPCR5ForTwoSources) {
    EXPECT_TRUE(combinePCR6({ m3(), m4() }).equals(combinePCR5(m3(), m4()), 1e-12));
    EXPECT_TRUE(combinePCR6({ m1(), m2() }).equals(combinePCR5(m1(), m2()), 1e-12));
}

TEST(PCRRulesTest, PCR6ThreeSources) {
    MassFunction a = MassFunction::create({ { { "a" }, 1.0 } });
    MassFunction b = MassFunction::create({ { { "b" }, 1.0 } });
    MassFunction result = combinePCR6({ a, b, b });
    EXPECT_NEAR(result.mass({ "a" }), 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 2.0 / 3.0, 1e-12);

    MassFunction mixed = combinePCR6({ m1(), m2(), m3() });
    EXPECT_NEAR(mixed.total(), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(mixed.conflictMass(), 0.0);
}

TEST(PCRRulesTest, PCR6Edges) {
    EXPECT_THROW(combinePCR6({}), ValidationError);
    EXPECT_TRUE(combinePCR6({ m1() }).equals(m1()));
}
