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
#include "../src/objects/Frame.h"
#include "../src/objects/MassFunction.h"

using namespace dsfusion;

TEST(FrameTest, LabelsAreSortedAndDeduplicated) {
    Frame frame({ "c", "a", "b", "a" });
    EXPECT_EQ(frame.size(), 3u);
    EXPECT_EQ(frame.elements(), std::vector<std::string>({ "a", "b", "c" }));
    EXPECT_TRUE(frame.contains("b"));
    EXPECT_FALSE(frame.contains("d"));
    EXPECT_EQ(frame.indexOf("c"), 2u);
}

TEST(FrameTest, EqualityIsByContent) {
    EXPECT_EQ(Frame({ "x", "y" }), Frame({ "y", "x", "y" }));
    EXPECT_NE(Frame({ "x", "y" }), Frame({ "x", "y", "z" }));
}

TEST(FrameTest, EmptyFrameIsValid) {
    Frame frame;
    EXPECT_TRUE(frame.empty());
    EXPECT_TRUE(frame.universe().empty());
    EXPECT_EQ(frame.powerset().size(), 1u);
    EXPECT_EQ(frame.format(frame.universe()), "{}");
}

TEST(FrameTest, RejectsEmptyLabels) {
    EXPECT_THROW(Frame({ "a", "" }), ValidationError);
}

TEST(FrameTest, RejectsLabelsOutsideTheInterchangeAlphabet) {
    EXPECT_THROW(Frame({ "a,b" }), ValidationError);
    EXPECT_THROW(Frame({ "{a}" }), ValidationError);
    EXPECT_THROW(Frame({ "a b" }), ValidationError);
    EXPECT_THROW(Frame({ "x-1" }), ValidationError);
    EXPECT_THROW(MassFunction::create({ { { "a,b" }, 1.0 } }), ValidationError);

    Frame frame({ "sensor_1", "Target2" });
    EXPECT_EQ(frame.size(), 2u);
    EXPECT_TRUE(Frame::isValidLabel("_"));
    EXPECT_FALSE(Frame::isValidLabel(""));
}

TEST(FrameTest, UnknownLabelIsAValidationError) {
    Frame frame({ "a", "b" });
    EXPECT_THROW(frame.indexOf("z"), ValidationError);
    EXPECT_THROW(frame.subset({ "a", "z" }), ValidationError);
}

TEST(FrameTest, FormatsSortedCommaSeparated) {
    Frame frame({ "B", "A", "C" });
    EXPECT_EQ(frame.format(frame.subset({ "C", "A" })), "{A,C}");
    EXPECT_EQ(frame.format(frame.universe()), "{A,B,C}");
    EXPECT_EQ(frame.format(Subset()), "{}");
}

TEST(FrameTest, ParsesInterchangeStrings) {
    Frame frame({ "A", "B", "C" });
    EXPECT_EQ(frame.parse("{A,B}"), frame.subset({ "A", "B" }));
    EXPECT_EQ(frame.parse(" { B , A } "), frame.subset({ "A", "B" }));
    EXPECT_TRUE(frame.parse("{}").empty());
    EXPECT_TRUE(Frame::parseLabels("{ }").empty());

    EXPECT_THROW(frame.parse("A,B"), ValidationError);
    EXPECT_THROW(frame.parse("{A,,B}"), ValidationError);
    EXPECT_THROW(frame.parse("{A,D}"), ValidationError);
}

TEST(FrameTest, PowersetIsRestartable) {
    Frame frame({ "a", "b", "c" });
    Powerset subsets = frame.powerset();
    EXPECT_EQ(subsets.size(), 8u);

    int first = 0;
    for (Subset s : subsets) {
        EXPECT_TRUE(s.isSubsetOf(frame.universe()));
        first++;
    }
    int second = 0;
    for (auto it = subsets.begin(); it != subsets.end(); ++it) {
        second++;
    }
    EXPECT_EQ(first, 8);
    EXPECT_EQ(second, 8);
    EXPECT_TRUE((*subsets.begin()).empty());
}

TEST(FrameTest, TranslateBetweenFrames) {
    Frame small({ "b", "c" });
    Frame large({ "a", "b", "c" });
    Subset bc = small.universe();
    EXPECT_EQ(large.translate(bc, small), large.subset({ "b", "c" }));
    EXPECT_THROW(small.translate(large.subset({ "a" }), large), ValidationError);
    EXPECT_TRUE(small.isSubframeOf(large));
    EXPECT_EQ(small.unite(Frame({ "a" })), large);
}

TEST(SubsetTest, SetOperations) {
    Subset ab(0b011);
    Subset bc(0b110);
    EXPECT_EQ((ab & bc).mask(), 0b010u);
    EXPECT_EQ((ab | bc).mask(), 0b111u);
    EXPECT_EQ((ab - bc).mask(), 0b001u);
    EXPECT_EQ(ab.size(), 2u);
    EXPECT_TRUE(Subset(0b010).isSubsetOf(ab));
    EXPECT_TRUE(ab.intersects(bc));
    EXPECT_FALSE(Subset::singleton(0).intersects(Subset::singleton(2)));
}
