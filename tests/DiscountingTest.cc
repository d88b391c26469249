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

#include <cmath>
#include <gtest/gtest.h>

#include "../src/common/Exceptions.h"
#include "../src/objects/Discounting.h"

using namespace dsfusion;

namespace {

MassFunction sample() {
    return MassFunction::create({ { { "a" }, 0.4 }, { { "b" }, 0.3 }, { { "a", "b" }, 0.3 } });
}

MassFunction threeElements() {
    return MassFunction::create({ { { "a" }, 0.2 }, { { "b", "c" }, 0.3 }, { { "b" }, 0.1 },
            { { "a", "b", "c" }, 0.4 } });
}

}

TEST(ClassicalDiscountTest, ScalesTowardsIgnorance) {
    MassFunction result = discountClassical(sample(), 0.8);
    EXPECT_NEAR(result.mass({ "a" }), 0.32, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.24, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.44, 1e-12);
    EXPECT_NEAR(result.total(), 1.0, 1e-12);
}

TEST(ClassicalDiscountTest, Extremes) {
    MassFunction m = sample();
    EXPECT_TRUE(discountClassical(m, 1.0).equals(m));
    MassFunction vacuous = discountClassical(m, 0.0);
    EXPECT_TRUE(vacuous.equals(MassFunction::vacuous(m.frame())));
    EXPECT_EQ(vacuous.frame(), m.frame());
}

TEST(ClassicalDiscountTest, MovesDiscountedMassToFrame) {
    MassFunction m = MassFunction::create({ { { "a" }, 1.0 } }, Frame({ "a", "b" }));
    MassFunction result = discountClassical(m, 0.9);
    EXPECT_NEAR(result.mass({ "a" }), 0.9, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.1, 1e-12);
}

TEST(ClassicalDiscountTest, RejectsInvalidReliability) {
    EXPECT_THROW(discountClassical(sample(), 1.5), InvalidReliability);
    EXPECT_THROW(discountClassical(sample(), -0.1), InvalidReliability);
    EXPECT_THROW(discountClassical(sample(), std::nan("")), InvalidReliability);
}

TEST(ContextualDiscountTest, Shortcuts) {
    MassFunction m = sample();
    EXPECT_TRUE(discountContextual(m, {}).equals(m));
    EXPECT_TRUE(discountContextual(m, { { "a", 0.0 }, { "b", 0.0 } }).equals(m));
    EXPECT_TRUE(discountContextual(m, { { "a", 1.0 }, { "b", 1.0 } })
            .equals(MassFunction::vacuous(m.frame())));
}

TEST(ContextualDiscountTest, SingleElementRate) {
    MassFunction result = discountContextual(sample(), { { "a", 0.2 } });
    // G m before renormalization: {a}: 0.32, {b}: 0.3, {a,b}: 0.06 + 0.24
    EXPECT_NEAR(result.mass({ "a" }), 0.32 / 0.92, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.30 / 0.92, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.30 / 0.92, 1e-12);
}

TEST(ContextualDiscountTest, RatesOnEveryElement) {
    MassFunction m = MassFunction::create({ { { "a" }, 1.0 } }, Frame({ "a", "b" }));
    MassFunction result = discountContextual(m, { { "a", 0.4 }, { "b", 0.5 } });
    EXPECT_NEAR(result.mass({ "a" }), 0.6 / 0.9, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.3 / 0.9, 1e-12);
    EXPECT_TRUE(result.hasExplicitFrame());
}

TEST(ContextualDiscountTest, GeneralizationMatrix) {
    Frame frame({ "a", "b" });
    dlib::matrix<double> g = generalizationMatrix(frame, { { "a", 0.2 } });
    ASSERT_EQ(g.nr(), 4);
    ASSERT_EQ(g.nc(), 4);
    EXPECT_DOUBLE_EQ(g(1, 1), 0.8);
    EXPECT_DOUBLE_EQ(g(2, 2), 1.0);
    EXPECT_DOUBLE_EQ(g(3, 2), 0.2);
    EXPECT_DOUBLE_EQ(g(3, 1), 0.0);
    EXPECT_DOUBLE_EQ(g(3, 3), 0.8);
    // B must be a subset of A
    EXPECT_DOUBLE_EQ(g(1, 3), 0.0);
    EXPECT_DOUBLE_EQ(g(0, 0), 0.0);
}

TEST(ContextualDiscountTest, RejectsInvalidInput) {
    EXPECT_THROW(discountContextual(sample(), { { "z", 0.5 } }), ValidationError);
    EXPECT_THROW(discountContextual(sample(), { { "a", 1.2 } }), InvalidReliability);

    std::vector<std::string> labels;
    for (int i = 0; i < 11; i++) {
        labels.push_back("e" + std::to_string(i));
    }
    MassFunction large = MassFunction::vacuous(Frame(labels));
    EXPECT_THROW(discountContextual(large, { { "e0", 0.5 } }), ValidationError);
}

TEST(ThetaContextualDiscountTest, BlockRates) {
    Frame frame({ "a", "b", "c" });
    MassFunction m = MassFunction::create({ { { "a" }, 1.0 } }, frame);
    MassFunction result = discountThetaContextual(m, { { "a" }, { "b", "c" } },
            { { { "b", "c" }, 0.5 } });
    EXPECT_NEAR(result.mass({ "a" }), 0.4, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.2, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "c" }), 0.2, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b", "c" }), 0.2, 1e-12);
}

TEST(ThetaContextualDiscountTest, SingletonPartitionIsContextual) {
    MassFunction m = threeElements();
    MassFunction theta = discountThetaContextual(m, { { "a" }, { "b" }, { "c" } },
            { { { "a" }, 0.3 }, { { "b" }, 0.6 } });
    MassFunction contextual = discountContextual(m, { { "a", 0.3 }, { "b", 0.6 } });
    EXPECT_TRUE(theta.equals(contextual, 1e-12));
}

TEST(ThetaContextualDiscountTest, Shortcuts) {
    MassFunction m = threeElements();
    EXPECT_TRUE(discountThetaContextual(m, { { "a", "b", "c" } }, {}).equals(m));
    EXPECT_TRUE(discountThetaContextual(m, { { "a" }, { "b", "c" } },
            { { { "a" }, 1.0 }, { { "b", "c" }, 1.0 } }).equals(MassFunction::vacuous(m.frame())));
}

TEST(ThetaContextualDiscountTest, RejectsInvalidPartitions) {
    MassFunction m = threeElements();
    std::map<std::vector<std::string>, double> none;
    EXPECT_THROW(discountThetaContextual(m, { { "a", "b" }, { "b", "c" } }, none),
            InvalidPartitionError);
    EXPECT_THROW(discountThetaContextual(m, { { "a" }, { "b" } }, none),
            InvalidPartitionError);
    EXPECT_THROW(discountThetaContextual(m, { { "a" }, {}, { "b", "c" } }, none),
            InvalidPartitionError);
    EXPECT_THROW(discountThetaContextual(m, { { "a" }, { "b", "c", "d" } }, none),
            InvalidPartitionError);
    EXPECT_THROW(discountThetaContextual(m, { { "a" }, { "b", "c" } }, { { { "b" }, 0.5 } }),
            InvalidPartitionError);
    EXPECT_THROW(discountThetaContextual(m, { { "a" }, { "b", "c" } }, { { { "a" }, 2.0 } }),
            InvalidReliability);
}

TEST(ContextReliabilityDiscountTest, MovesUnreliableMassToFrame) {
    MassFunction m = MassFunction::create({ { { "a" }, 0.6 }, { { "a", "b" }, 0.4 } });
    MassFunction result = discountByContexts(m, { { { "a" }, 0.5 } });
    EXPECT_NEAR(result.mass({ "a" }), 0.3, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.7, 1e-12);

    MassFunction reliable = discountByContexts(m, { { { "a" }, 1.0 } });
    EXPECT_TRUE(reliable.equals(m));
}

TEST(ContextReliabilityDiscountTest, ContextsApplyInOrder) {
    MassFunction m = MassFunction::create({ { { "a" }, 0.6 }, { { "b" }, 0.4 } });
    MassFunction result = discountByContexts(m, { { { "a" }, 0.5 }, { { "b" }, 0.5 } });
    EXPECT_NEAR(result.mass({ "a" }), 0.3, 1e-12);
    EXPECT_NEAR(result.mass({ "b" }), 0.2, 1e-12);
    EXPECT_NEAR(result.mass({ "a", "b" }), 0.5, 1e-12);
}

TEST(ContextReliabilityDiscountTest, RejectsInvalidReliability) {
    EXPECT_THROW(discountByContexts(sample(), { { { "a" }, -1.0 } }), InvalidReliability);
    EXPECT_THROW(discountByContexts(sample(), { { { "z" }, 0.5 } }), ValidationError);
}
