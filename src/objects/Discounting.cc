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

#include "Discounting.h"

#include <cmath>
#include <sstream>

#include "../common/Constants.h"
#include "../common/Exceptions.h"

namespace dsfusion {

namespace {

void checkRate(double rate, const std::string& context) {
    if (std::isnan(rate) || rate < 0.0 || rate > 1.0) {
        std::ostringstream oss;
        oss << "Discount rate for " << context << " must be in [0,1], got " << rate;
        throw InvalidReliability(oss.str());
    }
}

bool allEqual(const std::vector<double>& rates, double value) {
    for (double rate : rates) {
        if (rate != value) {
            return false;
        }
    }
    return true;
}

// one singleton context per element, rate 0 when not given
void singletonContexts(const Frame& frame, const std::map<std::string, double>& alphas,
        std::vector<Subset>& blocks, std::vector<double>& rates) {
    for (std::size_t i = 0; i < frame.size(); ++i) {
        blocks.push_back(Subset::singleton(i));
        auto it = alphas.find(frame.elements()[i]);
        rates.push_back(it != alphas.end() ? it->second : 0.0);
    }
}

MassFunction vacuousLike(const MassFunction& m) {
    MassFunction::MassMap masses;
    masses[m.frame().universe()] = 1.0;
    return MassFunction::fromRaw(m.frame(), masses, m.hasExplicitFrame());
}

/*
 * m' = G m over the non-empty subsets, then prune and renormalize.
 */
MassFunction applyGeneralization(const MassFunction& m,
        const std::vector<Subset>& blocks, const std::vector<double>& rates) {
    if (allEqual(rates, 0.0)) {
        return m;
    }
    if (allEqual(rates, 1.0)) {
        return vacuousLike(m);
    }
    const Frame& frame = m.frame();
    dlib::matrix<double> g = thetaGeneralizationMatrix(frame, blocks, rates);

    dlib::matrix<double, 0, 1> before = dlib::zeros_matrix<double>(g.nr(), 1);
    for (const auto& [focal, value] : m) {
        if (!focal.empty()) {
            before(focal.mask()) = value;
        }
    }
    dlib::matrix<double, 0, 1> after = g * before;

    MassFunction::MassMap masses;
    for (long i = 1; i < after.size(); ++i) {
        if (after(i) > constants::PRUNE_EPSILON) {
            masses[Subset(i)] = after(i);
        }
    }
    // every focal set touched a fully unreliable context
    if (masses.empty()) {
        return vacuousLike(m);
    }
    return MassFunction::create(frame, masses, m.hasExplicitFrame());
}

}

MassFunction discountClassical(const MassFunction& m, double alpha) {
    if (std::isnan(alpha) || alpha < 0.0 || alpha > 1.0) {
        std::ostringstream oss;
        oss << "Reliability factor must be between 0 and 1, got " << alpha;
        throw InvalidReliability(oss.str());
    }
    if (alpha == 1.0) {
        return m;
    }
    if (alpha == 0.0) {
        return vacuousLike(m);
    }

    const Subset omega = m.frame().universe();
    MassFunction::MassMap masses;
    for (const auto& [focal, value] : m) {
        masses[focal] = alpha * value;
    }
    masses[omega] += 1.0 - alpha;
    return MassFunction::fromRaw(m.frame(), masses, m.hasExplicitFrame());
}

dlib::matrix<double> thetaGeneralizationMatrix(const Frame& frame,
        const std::vector<Subset>& blocks, const std::vector<double>& rates) {
    if (frame.size() > constants::MAX_CONTEXTUAL_FRAME_SIZE) {
        throw ValidationError(
                "Contextual discounting supports at most "
                        + std::to_string(constants::MAX_CONTEXTUAL_FRAME_SIZE)
                        + " frame elements, got " + std::to_string(frame.size()));
    }
    Powerset subsets = frame.powerset();
    const long n = subsets.size();
    dlib::matrix<double> g = dlib::zeros_matrix<double>(n, n);

    for (Subset a : subsets) {
        if (a.empty()) {
            continue;
        }
        // B ranges over the non-empty submasks of A
        for (Subset::mask_type b = a.mask(); b != 0; b = (b - 1) & a.mask()) {
            double value = 1.0;
            for (std::size_t k = 0; k < blocks.size(); ++k) {
                if (blocks[k].intersects(Subset(b))) {
                    value *= 1.0 - rates[k];
                } else if (blocks[k].intersects(a)) {
                    value *= rates[k];
                }
            }
            g(a.mask(), b) = value;
        }
    }
    return g;
}

dlib::matrix<double> generalizationMatrix(const Frame& frame,
        const std::map<std::string, double>& alphas) {
    std::vector<Subset> blocks;
    std::vector<double> rates;
    singletonContexts(frame, alphas, blocks, rates);
    return thetaGeneralizationMatrix(frame, blocks, rates);
}

MassFunction discountContextual(const MassFunction& m,
        const std::map<std::string, double>& alphas) {
    const Frame& frame = m.frame();
    for (const auto& [element, rate] : alphas) {
        if (!frame.contains(element)) {
            throw ValidationError(
                    "Element " + element + " not in frame of discernment");
        }
        checkRate(rate, element);
    }

    std::vector<Subset> blocks;
    std::vector<double> rates;
    singletonContexts(frame, alphas, blocks, rates);
    return applyGeneralization(m, blocks, rates);
}

MassFunction discountThetaContextual(const MassFunction& m, const Partition& partition,
        const std::map<std::vector<std::string>, double>& alphas) {
    const Frame& frame = m.frame();
    std::vector<Subset> blocks;
    Subset covered;
    for (const auto& labels : partition) {
        Subset block;
        for (const auto& label : labels) {
            if (!frame.contains(label)) {
                throw InvalidPartitionError(
                        "Partition element " + label + " is not in the frame");
            }
            block = block | Subset::singleton(frame.indexOf(label));
        }
        if (block.empty()) {
            throw InvalidPartitionError("Partition blocks must not be empty");
        }
        if (block.intersects(covered)) {
            throw InvalidPartitionError(
                    "Theta partition must consist of disjoint subsets");
        }
        covered = covered | block;
        blocks.push_back(block);
    }
    if (covered != frame.universe()) {
        throw InvalidPartitionError(
                "Theta partition must cover the entire frame of discernment");
    }

    std::vector<double> rates(blocks.size(), 0.0);
    for (const auto& [labels, rate] : alphas) {
        Subset key;
        for (const auto& label : labels) {
            if (!frame.contains(label)) {
                throw InvalidPartitionError(
                        "Discount rate keyed by unknown element " + label);
            }
            key = key | Subset::singleton(frame.indexOf(label));
        }
        std::size_t k = 0;
        while (k < blocks.size() && blocks[k] != key) {
            ++k;
        }
        if (k == blocks.size()) {
            throw InvalidPartitionError(
                    "Subset " + frame.format(key) + " not in theta partition");
        }
        checkRate(rate, frame.format(key));
        rates[k] = rate;
    }
    return applyGeneralization(m, blocks, rates);
}

MassFunction discountByContexts(const MassFunction& m,
        const std::vector<std::pair<std::vector<std::string>, double> >& contexts) {
    const Frame& frame = m.frame();
    const Subset omega = frame.universe();
    MassFunction::MassMap current = m.masses();

    for (const auto& [labels, reliability] : contexts) {
        Subset context = frame.subset(labels);
        if (std::isnan(reliability) || reliability < 0.0 || reliability > 1.0) {
            std::ostringstream oss;
            oss << "Reliability factor for " << frame.format(context)
                    << " must be between 0 and 1, got " << reliability;
            throw InvalidReliability(oss.str());
        }
        MassFunction::MassMap next;
        for (const auto& [focal, value] : current) {
            if (focal.isSubsetOf(context)) {
                next[focal] += reliability * value;
                next[omega] += (1.0 - reliability) * value;
            } else {
                next[focal] += value;
            }
        }
        current = next;
    }
    return MassFunction::fromRaw(frame, current, m.hasExplicitFrame());
}

}
