#include <gtest/gtest.h>

#include <vector>

#include "route_planner/assembler.hpp"

using namespace route_planner;

TEST(ConcatenateSegmentsTest, DropsDuplicatedJoinCities)
{
    const std::vector<Route> segments = {{"A", "B"}, {"B", "C", "D"}, {"D", "E"}};
    EXPECT_EQ(concatenate_segments(segments), (Route{"A", "B", "C", "D", "E"}));
}

TEST(ConcatenateSegmentsTest, SingleCitySegments)
{
    const std::vector<Route> segments = {{"A"}, {"A", "B"}, {"B"}};
    EXPECT_EQ(concatenate_segments(segments), (Route{"A", "B"}));
}

TEST(ConcatenateSegmentsTest, SingleSegmentIsCopiedWhole)
{
    EXPECT_EQ(concatenate_segments({{"A", "B", "C"}}), (Route{"A", "B", "C"}));
}

TEST(ConcatenateSegmentsTest, NoSegmentsGivesEmptyRoute)
{
    EXPECT_TRUE(concatenate_segments({}).empty());
}

TEST(ConcatenateSegmentsTest, EmptySegmentThrows)
{
    EXPECT_THROW(concatenate_segments({{"A", "B"}, {}}), SegmentJoinError);
    EXPECT_THROW(concatenate_segments({{}, {"A", "B"}}), SegmentJoinError);
}

TEST(ConcatenateSegmentsTest, MismatchedJoinThrows)
{
    try
    {
        concatenate_segments({{"A", "B"}, {"C", "D"}});
        FAIL() << "expected SegmentJoinError";
    }
    catch (const SegmentJoinError &ex)
    {
        EXPECT_NE(std::string(ex.what()).find("B"), std::string::npos);
        EXPECT_NE(std::string(ex.what()).find("C"), std::string::npos);
    }
}
