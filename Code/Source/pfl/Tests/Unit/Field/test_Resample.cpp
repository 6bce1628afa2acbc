/**
 * @file test_Resample.cpp
 * @brief Unit tests for Resample.h - interpolation, scattering and indicator sampling
 */

#include <gtest/gtest.h>
#include "pfl/Field/Field.h"
#include "pfl/Field/Resample.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Extrapolation/Constants.h"
#include "pfl/Geometry/Mesh.h"
#include "pfl/Geometry/Point.h"
#include "pfl/Geometry/Sphere.h"
#include "pfl/Geometry/UniformGrid.h"

using namespace pfl;
using namespace pfl::math;
using namespace pfl::field;
using namespace pfl::extrapolation;
using geometry::Box;
using geometry::Mesh;
using geometry::UniformGrid;

namespace {
constexpr double tol = 1e-12;

std::shared_ptr<const UniformGrid> line(Index n, Real length) {
    return std::make_shared<const UniformGrid>(Shape{spatial("x", n)}, Box::from_size({"x"}, {length}));
}

Tensor at_x(Real x) {
    return Tensor::vector({"x"}, {x});
}

Tensor x_of(const Tensor& p) {
    return p.slice(Selection{{"vector", std::string("x")}});
}
} // namespace

// ============================================================================
// Grids
// ============================================================================

class GridResampleTest : public ::testing::Test {
protected:
    std::shared_ptr<const UniformGrid> grid = line(4, 4);
    std::shared_ptr<const UniformGrid> plane = std::make_shared<const UniformGrid>(
        Shape{spatial("x", 4), spatial("y", 3)}, Box::from_size({"x", "y"}, {4, 3}));
    Tensor ramp = Tensor::from_values(Shape{spatial("x", 4)}, {1, 2, 3, 4});
};

TEST_F(GridResampleTest, LinearInterpolationOntoCoarserGrid) {
    Field f(grid, ramp, ZERO_GRADIENT);
    Field coarse(line(2, 4), f, ZERO_GRADIENT);
    EXPECT_NEAR(coarse.values().value({{"x", 0}}), 1.5, tol);
    EXPECT_NEAR(coarse.values().value({{"x", 1}}), 3.5, tol);
}

TEST_F(GridResampleTest, OutsideValuesFollowTheRule) {
    EXPECT_NEAR(sample_at_points(Field(grid, ramp, ZERO_GRADIENT), at_x(0.25)).item(), 1.0, tol);
    EXPECT_NEAR(sample_at_points(Field(grid, ramp, ZERO), at_x(0.25)).item(), 0.75, tol);
    EXPECT_NEAR(sample_at_points(Field(grid, ramp, ZERO), at_x(-3)).item(), 0.0, tol);
}

TEST_F(GridResampleTest, PeriodicAxesWrap) {
    Field f(grid, ramp, PERIODIC);
    EXPECT_NEAR(sample_at_points(f, at_x(4.0)).item(), 2.5, tol);
    EXPECT_NEAR(sample_at_points(f, at_x(4.5)).item(), 1.0, tol);
    EXPECT_NEAR(sample_at_points(f, at_x(-3.5)).item(), 1.0, tol);
}

TEST_F(GridResampleTest, SameGeometryIsUnchanged) {
    Field f(grid, ramp, ZERO_GRADIENT);
    EXPECT_TRUE(resample(f, f) == f);
    EXPECT_TRUE(Field(grid, f, ZERO_GRADIENT) == f);
}

TEST_F(GridResampleTest, InitializerAtCenters) {
    Field f(plane, [](const Tensor& p) { return x_of(p) * Tensor(Real(2)); });
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 1}, {"y", 2}}), 3.0);
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 3}, {"y", 0}}), 7.0);
}

TEST_F(GridResampleTest, InitializerAtFacesTakesNormalComponents) {
    Field f(plane, [](const Tensor& p) { return p; }, ZERO, SampleLocation::Face);
    ASSERT_TRUE(f.is_staggered());
    Tensor x_faces = f.values().component(0, "~vector");
    EXPECT_EQ(x_faces.shape().size("x"), 3);
    EXPECT_DOUBLE_EQ(x_faces.value({{"x", 0}, {"y", 0}}), 1.0);
    Tensor y_faces = f.values().component(1, "~vector");
    EXPECT_DOUBLE_EQ(y_faces.value({{"x", 0}, {"y", 1}}), 2.0);
}

TEST_F(GridResampleTest, ValuesOfAnotherFieldOntoFaces) {
    Field target(plane, Tensor(Real(0)), ZERO_GRADIENT, SampleLocation::Face);
    Field v(plane, Tensor::vector({"x", "y"}, {2, 3}), ZERO_GRADIENT);
    Field projected = target.with_values(v);
    ASSERT_TRUE(projected.is_staggered());
    EXPECT_TRUE(close(projected.values().component(0, "~vector"), Tensor(Real(2))));
    EXPECT_TRUE(close(projected.values().component(1, "~vector"), Tensor(Real(3))));
}

TEST_F(GridResampleTest, SampleCoordinatesOfFaces) {
    extrapolation::PadCoordinates centers = sample_coordinates(*plane);
    EXPECT_DOUBLE_EQ(centers.coordinate("x", 0), 0.5);
    EXPECT_DOUBLE_EQ(centers.coordinate("y", -1), -0.5);
    extrapolation::PadCoordinates faces = sample_coordinates(*plane, "x", 1);
    EXPECT_DOUBLE_EQ(faces.coordinate("x", 0), 1.0);
    EXPECT_DOUBLE_EQ(faces.coordinate("y", 0), 0.5);
}

// ============================================================================
// Indicators
// ============================================================================

TEST_F(GridResampleTest, HardIndicator) {
    auto sphere = std::make_shared<const geometry::Sphere>(Tensor::vector({"x", "y"}, {2, 1.5}), Tensor(Real(1)));
    Field inside(plane, sphere);
    EXPECT_DOUBLE_EQ(inside.values().reduce(ReduceOp::Sum).item(), 2.0);
    EXPECT_DOUBLE_EQ(inside.values().value({{"x", 1}, {"y", 1}}), 1.0);
    EXPECT_DOUBLE_EQ(inside.values().value({{"x", 0}, {"y", 1}}), 0.0);
}

TEST_F(GridResampleTest, SoftIndicatorRamps) {
    auto sphere = std::make_shared<const geometry::Sphere>(Tensor::vector({"x", "y"}, {2, 1.5}), Tensor(Real(1)));
    SampleOptions options;
    options.soft = true;
    Field soft(plane, sphere, Boundary(), SampleLocation::Center, options);
    const Real near_center = soft.values().value({{"x", 1}, {"y", 1}});
    EXPECT_GT(near_center, 0.5);
    EXPECT_LT(near_center, 1.0);
    EXPECT_DOUBLE_EQ(soft.values().value({{"x", 0}, {"y", 0}}), 0.0);
    EXPECT_GE(soft.values().reduce(ReduceOp::Min).item(), 0.0);
    EXPECT_LE(soft.values().reduce(ReduceOp::Max).item(), 1.0);
}

// ============================================================================
// Point clouds
// ============================================================================

class ScatterTest : public ::testing::Test {
protected:
    std::shared_ptr<const UniformGrid> plane = std::make_shared<const UniformGrid>(
        Shape{spatial("x", 4), spatial("y", 3)}, Box::from_size({"x", "y"}, {4, 3}));
    Field cloud{std::make_shared<const geometry::Point>(Tensor::from_values(
                    Shape{instance("points", 3), vector_dim({"x", "y"})}, {0.5, 0.5, 0.7, 0.2, 3.5, 2.5})),
                Tensor::from_values(Shape{instance("points", 3)}, {1, 3, 5})};
};

TEST_F(ScatterTest, MeanPerCell) {
    Field f(plane, cloud);
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 0}, {"y", 0}}), 2.0);
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 3}, {"y", 2}}), 5.0);
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 1}, {"y", 1}}), 0.0);
}

TEST_F(ScatterTest, SumPerCell) {
    SampleOptions options;
    options.reduce = ScatterReduce::Sum;
    Field f(plane, cloud, Boundary(), SampleLocation::Center, options);
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 0}, {"y", 0}}), 4.0);
    EXPECT_DOUBLE_EQ(f.values().reduce(ReduceOp::Sum).item(), 9.0);
}

TEST_F(ScatterTest, OnlyGridCentersAreSupported) {
    EXPECT_THROW(Field(plane, cloud, Boundary(), SampleLocation::Face), NotImplementedException);
    EXPECT_THROW(sample_at_points(cloud, Tensor::vector({"x", "y"}, {1, 1})), NotImplementedException);
}

// ============================================================================
// Meshes
// ============================================================================

class MeshResampleTest : public ::testing::Test {
protected:
    std::shared_ptr<const Mesh> mesh =
        Mesh::from_grid(UniformGrid(Shape{spatial("x", 2), spatial("y", 2)}, Box::from_size({"x", "y"}, {2, 2})));
    Field cells{mesh, Tensor::from_values(Shape{instance("cells", 4)}, {1, 2, 3, 4}), ZERO_GRADIENT};
};

TEST_F(MeshResampleTest, CellsToFaces) {
    Field faces(mesh, cells, ZERO_GRADIENT, SampleLocation::Face);
    ASSERT_TRUE(faces.is_staggered());
    EXPECT_EQ(faces.values().shape().size("~faces"), 12);
    // Face 0 separates cells 0 and 2
    EXPECT_DOUBLE_EQ(faces.values().value({{"~faces", 0}}), 2.0);

    Field interior(mesh, cells, ZERO, SampleLocation::Face);
    EXPECT_EQ(interior.values().shape().size("~faces"), 4);
}

TEST_F(MeshResampleTest, FacesToCells) {
    Field faces(mesh, Tensor(Real(1)), ZERO_GRADIENT, SampleLocation::Face);
    Field back = faces.at_centers();
    EXPECT_TRUE(back.is_centered());
    EXPECT_TRUE(close(back.values(), Tensor::ones(Shape{instance("cells", 4)})));
}

TEST_F(MeshResampleTest, VectorsProjectedOnFaceNormals) {
    Field v(mesh, Tensor::vector({"x", "y"}, {2, 3}), ZERO_GRADIENT);
    SampleOptions options;
    options.dot_face_normal = true;
    Field flux(mesh, v, ZERO_GRADIENT, SampleLocation::Face, options);
    EXPECT_FALSE(flux.values().shape().contains("vector"));
    EXPECT_NEAR(flux.values().value({{"~faces", 0}}), 2.0, tol);
}

TEST_F(MeshResampleTest, MeshOntoGrid) {
    auto fine = std::make_shared<const UniformGrid>(Shape{spatial("x", 4), spatial("y", 4)},
                                                    Box::from_size({"x", "y"}, {2, 2}));
    Field f(fine, cells);
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 0}, {"y", 0}}), 1.0);
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 0}, {"y", 3}}), 2.0);
    EXPECT_DOUBLE_EQ(f.values().value({{"x", 3}, {"y", 3}}), 4.0);
}

TEST_F(MeshResampleTest, PointsOutsideTakeTheConstantRule) {
    Field fixed(mesh, cells.values(), constant(-1.0));
    EXPECT_DOUBLE_EQ(sample_at_points(fixed, Tensor::vector({"x", "y"}, {5, 5})).item(), -1.0);
    EXPECT_DOUBLE_EQ(sample_at_points(cells, Tensor::vector({"x", "y"}, {5, 5})).item(), 4.0);
}

TEST_F(MeshResampleTest, MeshOntoPointsIsNotImplemented) {
    auto points = std::make_shared<const geometry::Point>(Tensor::vector({"x", "y"}, {0.5, 0.5}));
    EXPECT_THROW(Field(points, cells), NotImplementedException);
}
