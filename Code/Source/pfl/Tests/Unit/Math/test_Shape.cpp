/**
 * @file test_Shape.cpp
 * @brief Unit tests for Shape.h - named dimensions and broadcasting
 */

#include <gtest/gtest.h>
#include "pfl/Math/Shape.h"
#include "pfl/Core/PFLException.h"

using namespace pfl;
using namespace pfl::math;

TEST(ShapeTest, CanonicalKindOrder) {
    Shape s{vector_dim({"x", "y"}), spatial("x", 3), batch("b", 2), dual("faces", 4)};
    std::vector<std::string> expected{"b", "~faces", "x", "vector"};
    EXPECT_EQ(s.names(), expected);
    EXPECT_EQ(s.volume(), 2 * 4 * 3 * 2);
}

TEST(ShapeTest, SpatialOrderOfAppearanceIsKept) {
    Shape s = spatial_shape({{"y", 4}, {"x", 3}});
    EXPECT_EQ(s.names()[0], "y");
    EXPECT_EQ(s.names()[1], "x");
}

TEST(ShapeTest, DualNamesCarryTilde) {
    Dim d = dual("vector", 2);
    EXPECT_EQ(d.name, "~vector");
    EXPECT_EQ(d.kind, DimKind::Dual);
    EXPECT_EQ(dual("~faces", 3).name, "~faces");
}

TEST(ShapeTest, MergeBroadcastsSizeOne) {
    Shape a = spatial_shape({{"x", 3}, {"y", 1}});
    Shape b = spatial_shape({{"y", 5}});
    Shape m = a & b;
    EXPECT_EQ(m.size("x"), 3);
    EXPECT_EQ(m.size("y"), 5);
}

TEST(ShapeTest, MergeConflictThrows) {
    Shape a = spatial_shape({{"x", 3}});
    Shape b = spatial_shape({{"x", 4}});
    EXPECT_THROW(a.merged(b), ShapeMismatchException);
    Shape out;
    EXPECT_FALSE(a.try_merge(b, out));
}

TEST(ShapeTest, MergeKeepsItemNames) {
    Shape a{channel("vector", 2)};
    Shape b{vector_dim({"x", "y"})};
    Shape m = a & b;
    EXPECT_EQ(m.item_names("vector"), (std::vector<std::string>{"x", "y"}));
}

TEST(ShapeTest, FilterByKindAndName) {
    Shape s{batch("b", 2), spatial("x", 3), spatial("y", 4), vector_dim({"x", "y"})};
    EXPECT_EQ(s.spatial().rank(), 2u);
    EXPECT_EQ(s.non_spatial().names(), (std::vector<std::string>{"b", "vector"}));
    EXPECT_EQ(s.without("x").rank(), 3u);
    EXPECT_EQ(s.only(std::vector<std::string>{"y", "missing"}).rank(), 1u);
}

TEST(ShapeTest, RenameToDualChangesKind) {
    Shape s{vector_dim({"x", "y"})};
    Shape r = s.renamed("vector", "~vector");
    EXPECT_EQ(r.dim("~vector").kind, DimKind::Dual);
    EXPECT_EQ(r.item_names("~vector"), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(r.renamed("~vector", "vector").dim("vector").kind, DimKind::Channel);
}

TEST(ShapeTest, NonUniformVolumeThrows) {
    Shape s{spatial("x", -1), dual("vector", 2)};
    EXPECT_FALSE(s.is_uniform());
    EXPECT_THROW(s.volume(), ShapeMismatchException);
}

TEST(ShapeTest, MissingDimensionThrows) {
    Shape s = spatial_shape({{"x", 3}});
    EXPECT_THROW(s.dim("y"), OutOfRangeException);
    EXPECT_EQ(s.index_of("y"), -1);
}

TEST(ShapeTest, DuplicateNamesRejected) {
    EXPECT_THROW((Shape{spatial("x", 3), spatial("x", 2)}), InvalidArgumentException);
}
