/**
 * @file test_Staggered.cpp
 * @brief Unit tests for face-sampled fields on grids and meshes
 */

#include <gtest/gtest.h>
#include "pfl/Field/Field.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Extrapolation/Constants.h"
#include "pfl/Geometry/Mesh.h"
#include "pfl/Geometry/UniformGrid.h"

using namespace pfl;
using namespace pfl::math;
using namespace pfl::field;
using namespace pfl::extrapolation;
using geometry::Box;
using geometry::Mesh;
using geometry::UniformGrid;

namespace {
Index faces_along(const Field& f, const std::string& axis, Index component) {
    return f.values().component(component, "~vector").shape().size(axis);
}
} // namespace

class StaggeredTest : public ::testing::Test {
protected:
    std::shared_ptr<const UniformGrid> grid = std::make_shared<const UniformGrid>(
        Shape{spatial("x", 4), spatial("y", 3)}, Box::from_size({"x", "y"}, {4, 3}));
};

TEST_F(StaggeredTest, StoredFacesDependOnTheRule) {
    Field fixed(grid, Tensor(Real(1)), ZERO, SampleLocation::Face);
    EXPECT_TRUE(fixed.is_staggered());
    EXPECT_EQ(faces_along(fixed, "x", 0), 3);
    EXPECT_EQ(faces_along(fixed, "y", 0), 3);
    EXPECT_EQ(faces_along(fixed, "x", 1), 4);
    EXPECT_EQ(faces_along(fixed, "y", 1), 2);

    Field open(grid, Tensor(Real(1)), ZERO_GRADIENT, SampleLocation::Face);
    EXPECT_EQ(faces_along(open, "x", 0), 5);
    EXPECT_EQ(faces_along(open, "y", 1), 4);

    Field periodic(grid, Tensor(Real(1)), PERIODIC, SampleLocation::Face);
    EXPECT_EQ(faces_along(periodic, "x", 0), 4);
    EXPECT_EQ(faces_along(periodic, "y", 1), 3);
}

TEST_F(StaggeredTest, FaceSamplingIsDetectedFromTheValues) {
    Field faces(grid, Tensor(Real(1)), ZERO, SampleLocation::Face);
    EXPECT_TRUE(faces.is_staggered());
    EXPECT_FALSE(faces.is_centered());
    EXPECT_EQ(faces.sampled_at(), SampleLocation::Face);

    Field centers(grid, Tensor(Real(1)), ZERO);
    EXPECT_FALSE(centers.is_staggered());
    EXPECT_TRUE(centers.is_centered());
    EXPECT_EQ(centers.sampled_at(), SampleLocation::Center);

    auto mesh = Mesh::from_grid(*grid);
    Field mesh_faces(mesh, Tensor(Real(1)), ZERO_GRADIENT, SampleLocation::Face);
    EXPECT_TRUE(mesh_faces.is_staggered());
    EXPECT_EQ(mesh_faces.sampled_at(), SampleLocation::Face);
}

TEST_F(StaggeredTest, ShapeListsTheVectorDimension) {
    Field f(grid, Tensor(Real(1)), ZERO, SampleLocation::Face);
    EXPECT_TRUE(f.shape().contains("vector"));
    EXPECT_EQ(f.shape().size("x"), 4);
    EXPECT_EQ(f.shape().size("vector"), 2);
    EXPECT_EQ(f.sampled_at(), SampleLocation::Face);
    EXPECT_TRUE(f.sampled_elements()->type() == geometry::GeometryType::Point);
}

TEST_F(StaggeredTest, FaceComponentRestoresFixedFaces) {
    Field f(grid, Tensor(Real(1)), ZERO, SampleLocation::Face);
    Tensor x_faces = f.face_component("x");
    EXPECT_EQ(x_faces.shape().size("x"), 5);
    EXPECT_DOUBLE_EQ(x_faces.value({{"x", 0}, {"y", 1}}), 0.0);
    EXPECT_DOUBLE_EQ(x_faces.value({{"x", 2}, {"y", 1}}), 1.0);
    EXPECT_DOUBLE_EQ(x_faces.value({{"x", 4}, {"y", 1}}), 0.0);
    EXPECT_THROW(f.face_component("z"), OutOfRangeException);
    EXPECT_THROW(Field(grid, Tensor(Real(1))).face_component("x"), InvalidArgumentException);
}

TEST_F(StaggeredTest, StaggeredTensorIsDense) {
    Field f(grid, Tensor(Real(1)), ZERO, SampleLocation::Face);
    Tensor dense = f.staggered_tensor();
    EXPECT_TRUE(dense.is_uniform());
    EXPECT_EQ(dense.shape().size("x"), 5);
    EXPECT_EQ(dense.shape().size("y"), 4);
    EXPECT_EQ(dense.shape().item_names("vector"), (std::vector<std::string>{"x", "y"}));
    EXPECT_DOUBLE_EQ(dense.value({{"x", 2}, {"y", 1}, {"vector", 0}}), 1.0);
    EXPECT_DOUBLE_EQ(dense.value({{"x", 0}, {"y", 1}, {"vector", 0}}), 0.0);
    EXPECT_DOUBLE_EQ(dense.value({{"x", 1}, {"y", 3}, {"vector", 1}}), 0.0);
    EXPECT_TRUE(close(f.uniform_values(), dense));
}

TEST_F(StaggeredTest, ChangingTheBoundaryRestoresAndDropsFaces) {
    Field fixed(grid, Tensor(Real(1)), ZERO, SampleLocation::Face);
    Field open = fixed.with_boundary(ZERO_GRADIENT);
    EXPECT_EQ(faces_along(open, "x", 0), 5);
    Tensor x_faces = open.values().component(0, "~vector");
    EXPECT_DOUBLE_EQ(x_faces.value({{"x", 0}, {"y", 0}}), 0.0);
    EXPECT_DOUBLE_EQ(x_faces.value({{"x", 1}, {"y", 0}}), 1.0);

    EXPECT_TRUE(open.with_boundary(ZERO) == fixed);
}

TEST_F(StaggeredTest, CenteredToFacesAndBack) {
    Field c(grid, Tensor::vector({"x", "y"}, {2, 3}), ZERO);
    Field faces = c.at_faces();
    ASSERT_TRUE(faces.is_staggered());
    EXPECT_TRUE(close(faces.values().component(0, "~vector"), Tensor(Real(2))));
    EXPECT_TRUE(close(faces.values().component(1, "~vector"), Tensor(Real(3))));

    Field back = faces.at_centers();
    EXPECT_TRUE(back.is_centered());
    // Boundary faces are zero, so cells next to the boundary see half the value
    EXPECT_DOUBLE_EQ(back.values().value({{"x", 0}, {"y", 1}, {"vector", 0}}), 1.0);
    EXPECT_DOUBLE_EQ(back.values().value({{"x", 1}, {"y", 1}, {"vector", 0}}), 2.0);
    EXPECT_DOUBLE_EQ(back.values().value({{"x", 1}, {"y", 0}, {"vector", 1}}), 1.5);
    EXPECT_DOUBLE_EQ(back.values().value({{"x", 1}, {"y", 1}, {"vector", 1}}), 3.0);
}

TEST_F(StaggeredTest, SliceComponentGivesPointCloud) {
    Field f(grid, Tensor(Real(1)), ZERO_GRADIENT, SampleLocation::Face);
    Field x = f.slice(Selection{{"vector", std::string("x")}});
    EXPECT_TRUE(x.is_point_cloud());
    EXPECT_EQ(x.values().shape().size("x"), 5);
    EXPECT_EQ(x.values().shape().size("y"), 3);
}

TEST_F(StaggeredTest, MeshFacesExcludeFixedBoundaries) {
    auto mesh = Mesh::from_grid(UniformGrid(Shape{spatial("x", 2), spatial("y", 2)}, Box::from_size({"x", "y"}, {2, 2})));
    Field fixed(mesh, Tensor(Real(1)), ZERO, SampleLocation::Face);
    EXPECT_TRUE(fixed.is_staggered());
    EXPECT_TRUE(fixed.is_mesh());
    EXPECT_EQ(fixed.values().shape().size("~faces"), 4);
    EXPECT_EQ(fixed.to_string().rfind("Mesh faces[", 0), 0u);

    Field open = fixed.with_boundary(ZERO_GRADIENT);
    EXPECT_EQ(open.values().shape().size("~faces"), 12);
    EXPECT_DOUBLE_EQ(open.values().reduce(ReduceOp::Sum).item(), 4.0);

    EXPECT_THROW(Field(std::make_shared<const geometry::Box>(Tensor::vector({"x"}, {0}), Tensor::vector({"x"}, {1})),
                       Tensor(Real(1)), ZERO, SampleLocation::Face),
                 InvalidArgumentException);
}
