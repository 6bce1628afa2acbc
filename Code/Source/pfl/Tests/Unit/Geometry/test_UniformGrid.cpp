/**
 * @file test_UniformGrid.cpp
 * @brief Unit tests for UniformGrid - cell centers, faces, slicing and padding
 */

#include <gtest/gtest.h>
#include "pfl/Geometry/UniformGrid.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/VectorOps.h"
#include <cmath>

using namespace pfl;
using namespace pfl::math;
using namespace pfl::geometry;

namespace {
constexpr double tol = 1e-12;

Tensor xy(Real x, Real y) {
    return Tensor::vector({"x", "y"}, {x, y});
}
} // namespace

class UniformGridTest : public ::testing::Test {
protected:
    UniformGridTest()
        : grid(std::make_shared<const UniformGrid>(Shape{spatial("x", 4), spatial("y", 2)},
                                                   Box::from_size({"x", "y"}, {2, 1}))) {}

    UniformGridPtr grid;
};

TEST_F(UniformGridTest, CellGeometry) {
    EXPECT_EQ(grid->shape(), (Shape{spatial("x", 4), spatial("y", 2)}));
    EXPECT_TRUE(close(grid->dx(), xy(0.5, 0.5)));
    EXPECT_NEAR(grid->volume().item(), 0.25, tol);
    EXPECT_NEAR(grid->bounding_radius().item(), std::sqrt(0.5) / 2, tol);

    Tensor c = grid->center();
    EXPECT_NEAR(c.value({{"x", 0}, {"y", 0}, {"vector", 0}}), 0.25, tol);
    EXPECT_NEAR(c.value({{"x", 3}, {"y", 1}, {"vector", 0}}), 1.75, tol);
    EXPECT_NEAR(c.value({{"x", 3}, {"y", 1}, {"vector", 1}}), 0.75, tol);
}

TEST_F(UniformGridTest, UnitCellConstructor) {
    UniformGrid unit(Shape{spatial("x", 3)});
    EXPECT_TRUE(close(unit.bounds()->upper(), Tensor::vector({"x"}, {3})));
    EXPECT_NEAR(unit.dx().item(), 1.0, tol);
}

TEST_F(UniformGridTest, BoundsFollowResolutionOrder) {
    UniformGrid flipped(Shape{spatial("y", 2), spatial("x", 4)}, Box::from_size({"x", "y"}, {2, 1}));
    EXPECT_EQ(flipped.axes(), (std::vector<std::string>{"y", "x"}));
    EXPECT_EQ(flipped.bounds()->vector_axes(), (std::vector<std::string>{"y", "x"}));
    EXPECT_NEAR(flipped.dx().value({{"vector", 0}}), 0.5, tol);
}

TEST_F(UniformGridTest, FacesAreNonUniform) {
    Tensor faces = grid->face_centers();
    ASSERT_FALSE(faces.is_uniform());
    EXPECT_EQ(faces.stack_dim(), "~vector");
    EXPECT_EQ(faces.components()[0].shape().size("x"), 5);
    EXPECT_EQ(faces.components()[0].shape().size("y"), 2);
    EXPECT_EQ(faces.components()[1].shape().size("x"), 4);
    EXPECT_EQ(faces.components()[1].shape().size("y"), 3);
    EXPECT_TRUE(grid->face_shape().contains("~vector"));
    EXPECT_EQ(grid->faces()->type(), GeometryType::Point);

    Tensor areas = grid->face_areas();
    EXPECT_NEAR(areas.value({{"~vector", 0}}), 0.5, tol);
    EXPECT_NEAR(areas.value({{"~vector", 1}}), 0.5, tol);
    EXPECT_TRUE(close(grid->face_normals(), identity_matrix({"x", "y"})));
}

TEST_F(UniformGridTest, BoundaryElementsSelectOuterCells) {
    BoundarySlices slices = grid->boundary_elements();
    ASSERT_EQ(slices.size(), 4u);
    Tensor upper_x = grid->center().slice(slices.at("x+"));
    EXPECT_EQ(upper_x.shape().size("x"), 1);
    EXPECT_EQ(upper_x.shape().size("y"), 2);
    EXPECT_NEAR(upper_x.value({{"x", 0}, {"y", 1}, {"vector", 0}}), 1.75, tol);
    EXPECT_EQ(grid->center().slice(slices.at("y-")).shape().size("y"), 1);
}

TEST_F(UniformGridTest, BoundaryFacesSelectOuterLayers) {
    BoundarySlices slices = grid->boundary_faces();
    ASSERT_EQ(slices.size(), 4u);
    Tensor lower_x = grid->face_centers().slice(slices.at("x-"));
    EXPECT_EQ(lower_x.shape().size("x"), 1);
    EXPECT_EQ(lower_x.shape().size("y"), 2);
    EXPECT_NEAR(lower_x.slice(Selection{{"vector", std::string("x")}}).max({"x", "y"}).item(), 0.0, tol);

    Tensor upper_y = grid->face_centers().slice(slices.at("y+"));
    EXPECT_EQ(upper_y.shape().size("y"), 1);
    EXPECT_NEAR(upper_y.slice(Selection{{"vector", std::string("y")}}).min({"x", "y"}).item(), 1.0, tol);
}

TEST_F(UniformGridTest, SliceByIndexRemovesAxis) {
    auto line = std::static_pointer_cast<const UniformGrid>(grid->slice(Selection{{"x", Index(1)}}));
    EXPECT_EQ(line->axes(), (std::vector<std::string>{"y"}));
    EXPECT_EQ(line->resolution(), (Shape{spatial("y", 2)}));
}

TEST_F(UniformGridTest, SliceByRangeShrinksBounds) {
    auto part = std::static_pointer_cast<const UniformGrid>(grid->slice(Selection{{"x", range(1, 3)}}));
    EXPECT_EQ(part->resolution().size("x"), 2);
    EXPECT_TRUE(close(part->bounds()->lower(), xy(0.5, 0)));
    EXPECT_TRUE(close(part->bounds()->upper(), xy(1.5, 1)));
    EXPECT_TRUE(close(part->dx(), grid->dx()));
    EXPECT_THROW(grid->slice(Selection{{"x", Index(7)}}), OutOfRangeException);
}

TEST_F(UniformGridTest, SliceByVectorKeepsAxes) {
    auto xs = std::static_pointer_cast<const UniformGrid>(
        grid->slice(Selection{{"vector", std::vector<std::string>{"x"}}}));
    EXPECT_EQ(xs->resolution(), (Shape{spatial("x", 4)}));
}

TEST_F(UniformGridTest, PaddedKeepsCellSize) {
    UniformGridPtr big = grid->padded({{"x", {1, 2}}});
    EXPECT_EQ(big->resolution().size("x"), 7);
    EXPECT_EQ(big->resolution().size("y"), 2);
    EXPECT_TRUE(close(big->bounds()->lower(), xy(-0.5, 0)));
    EXPECT_TRUE(close(big->bounds()->upper(), xy(3, 1)));
    EXPECT_TRUE(close(big->dx(), grid->dx()));
    EXPECT_THROW(grid->padded({{"y", {-2, -1}}}), InvalidArgumentException);
}

TEST_F(UniformGridTest, Transformations) {
    auto moved = std::static_pointer_cast<const UniformGrid>(grid->shifted(xy(1, 0)));
    EXPECT_TRUE(close(moved->bounds()->lower(), xy(1, 0)));
    EXPECT_NEAR(moved->center().value({{"x", 0}, {"y", 0}, {"vector", 0}}), 1.25, tol);
    EXPECT_THROW(grid->shifted(grid->center()), ShapeMismatchException);
    EXPECT_THROW(grid->at(xy(0, 0)), NotImplementedException);
    EXPECT_THROW(grid->rotated(Tensor(0.1)), NotImplementedException);

    auto doubled = std::static_pointer_cast<const UniformGrid>(grid->scaled(Tensor(2.0)));
    EXPECT_TRUE(close(doubled->dx(), xy(1, 1)));
}

TEST_F(UniformGridTest, DomainQueriesUseBounds) {
    EXPECT_DOUBLE_EQ(grid->lies_inside(xy(1.9, 0.1)).item(), 1.0);
    EXPECT_DOUBLE_EQ(grid->lies_inside(xy(2.1, 0.1)).item(), 0.0);
    EXPECT_NEAR(grid->approximate_signed_distance(xy(1, 0.5)).item(), -0.5, tol);
}

TEST_F(UniformGridTest, Equality) {
    UniformGrid same(Shape{spatial("x", 4), spatial("y", 2)}, Box::from_size({"x", "y"}, {2, 1}));
    UniformGrid finer(Shape{spatial("x", 8), spatial("y", 2)}, Box::from_size({"x", "y"}, {2, 1}));
    EXPECT_TRUE(*grid == same);
    EXPECT_TRUE(*grid != finer);
}

TEST_F(UniformGridTest, ConstructionErrors) {
    EXPECT_THROW(UniformGrid(Shape{instance("points", 3)}), InvalidArgumentException);
    EXPECT_THROW(UniformGrid(Shape{spatial("x", 4)}, Box::from_size({"x", "y"}, {2, 1})), InvalidArgumentException);
    EXPECT_THROW(UniformGrid(Shape{spatial("x", 4)}, nullptr), InvalidArgumentException);
    auto turned = std::static_pointer_cast<const Box>(Box::from_size({"x", "y"}, {2, 1})->rotated(Tensor(0.1)));
    EXPECT_THROW(UniformGrid(Shape{spatial("x", 4), spatial("y", 2)}, turned), InvalidArgumentException);
}
