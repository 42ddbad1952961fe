// Shared box math used by template suppression and the detection merger.
#include <gtest/gtest.h>

#include "uil/geometry.hpp"

using uil::geom::Box;

TEST(Geometry, IdenticalBoxesHaveUnitIou)
{
    Box a{10, 10, 40, 20};
    EXPECT_EQ(uil::geom::intersection_area(a, a), 800);
    EXPECT_EQ(uil::geom::union_area(a, a), 800);
    EXPECT_DOUBLE_EQ(uil::geom::iou(a, a), 1.0);
}

TEST(Geometry, DisjointAndTouchingBoxesDoNotIntersect)
{
    Box a{0, 0, 10, 10};
    Box far{50, 50, 10, 10};
    Box touching{10, 0, 10, 10}; // shares the x=10 edge
    EXPECT_EQ(uil::geom::intersection_area(a, far), 0);
    EXPECT_EQ(uil::geom::intersection_area(a, touching), 0);
    EXPECT_DOUBLE_EQ(uil::geom::iou(a, touching), 0.0);
}

TEST(Geometry, PartialOverlap)
{
    Box a{0, 0, 10, 10};
    Box b{5, 0, 10, 10};
    EXPECT_EQ(uil::geom::intersection_area(a, b), 50);
    EXPECT_EQ(uil::geom::union_area(a, b), 150);
    EXPECT_NEAR(uil::geom::iou(a, b), 1.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(uil::geom::overlap_of_smaller(a, b), 0.5);
}

TEST(Geometry, OverlapOfSmallerUsesSmallerArea)
{
    Box big{0, 0, 100, 100};
    Box small{90, 90, 20, 20}; // 10x10 of its 400 px inside big
    EXPECT_DOUBLE_EQ(uil::geom::overlap_of_smaller(big, small), 100.0 / 400.0);
    EXPECT_DOUBLE_EQ(uil::geom::overlap_of_smaller(small, big), 100.0 / 400.0);
}

TEST(Geometry, Containment)
{
    Box outer{0, 0, 100, 100};
    EXPECT_TRUE(uil::geom::contains(outer, Box{0, 0, 100, 100}));
    EXPECT_TRUE(uil::geom::contains(outer, Box{10, 10, 20, 20}));
    EXPECT_FALSE(uil::geom::contains(outer, Box{90, 90, 20, 20}));
    EXPECT_FALSE(uil::geom::contains(Box{10, 10, 20, 20}, outer));
}

TEST(Geometry, NestingRequiresClearlySmallerArea)
{
    Box outer{0, 0, 100, 100};
    EXPECT_TRUE(uil::geom::is_nested(Box{10, 10, 50, 50}, outer));
    EXPECT_FALSE(uil::geom::is_nested(Box{0, 0, 95, 100}, outer)); // 95% of the area
    EXPECT_FALSE(uil::geom::is_nested(outer, outer));
}

TEST(Geometry, DegenerateBoxesAreNeverOverlapping)
{
    Box empty{5, 5, 0, 10};
    Box a{0, 0, 10, 10};
    EXPECT_DOUBLE_EQ(uil::geom::iou(empty, empty), 0.0);
    EXPECT_DOUBLE_EQ(uil::geom::overlap_of_smaller(empty, a), 0.0);
}
