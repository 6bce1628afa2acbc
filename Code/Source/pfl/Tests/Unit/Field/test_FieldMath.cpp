/**
 * @file test_FieldMath.cpp
 * @brief Unit tests for FieldMath.h - stack, concat and pad
 */

#include <gtest/gtest.h>
#include "pfl/Field/FieldMath.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Extrapolation/Constants.h"
#include "pfl/Geometry/Point.h"
#include "pfl/Geometry/Sphere.h"
#include "pfl/Geometry/UniformGrid.h"

using namespace pfl;
using namespace pfl::math;
using namespace pfl::field;
using namespace pfl::extrapolation;
using geometry::Box;
using geometry::GeometryType;
using geometry::UniformGrid;

namespace {
constexpr double tol = 1e-12;

Field cloud(const std::vector<Real>& xy, const std::vector<Real>& values) {
    const auto n = static_cast<Index>(values.size());
    auto points = std::make_shared<const geometry::Point>(
        Tensor::from_values(Shape{instance("points", n), vector_dim({"x", "y"})}, xy));
    return Field(points, Tensor::from_values(Shape{instance("points", n)}, values), ZERO_GRADIENT);
}
} // namespace

class FieldMathTest : public ::testing::Test {
protected:
    std::shared_ptr<const UniformGrid> grid = std::make_shared<const UniformGrid>(Shape{spatial("x", 4)},
                                                                                  Box::from_size({"x"}, {4}));
    std::shared_ptr<const UniformGrid> plane = std::make_shared<const UniformGrid>(
        Shape{spatial("x", 4), spatial("y", 3)}, Box::from_size({"x", "y"}, {4, 3}));
    Tensor ramp = Tensor::from_values(Shape{spatial("x", 4)}, {1, 2, 3, 4});
};

// ============================================================================
// stack
// ============================================================================

TEST_F(FieldMathTest, StackOnSharedGeometry) {
    Field a(grid, ramp, ZERO_GRADIENT);
    Field b = a * 10.0;
    Field s = stack({a, b}, batch("b", 2));
    EXPECT_EQ(s.geometry(), a.geometry());
    EXPECT_EQ(s.shape().size("b"), 2);
    EXPECT_DOUBLE_EQ(s.values().value({{"b", 1}, {"x", 2}}), 30.0);
    EXPECT_TRUE(same(s.boundary(), ZERO_GRADIENT));
}

TEST_F(FieldMathTest, StackStacksGeometries) {
    Field a = cloud({0, 0, 1, 1}, {1, 2});
    Field b = cloud({2, 2, 3, 3}, {3, 4});
    Field s = stack({a, b}, batch("b", 2));
    EXPECT_EQ(s.geometry()->type(), GeometryType::Point);
    EXPECT_TRUE(s.geometry()->shape().contains("b"));
    EXPECT_NEAR(s.geometry()->center().value({{"b", 1}, {"points", 0}, {"vector", 0}}), 2.0, tol);
    EXPECT_DOUBLE_EQ(s.values().value({{"b", 1}, {"points", 1}}), 4.0);
}

TEST_F(FieldMathTest, StackStaggeredFields) {
    Field a(plane, Tensor(Real(1)), ZERO, SampleLocation::Face);
    Field b(plane, Tensor(Real(2)), ZERO, SampleLocation::Face);
    Field s = stack({a, b}, batch("b", 2));
    ASSERT_TRUE(s.is_staggered());
    Tensor x_faces = s.values().component(0, "~vector");
    EXPECT_EQ(x_faces.shape().size("b"), 2);
    EXPECT_EQ(x_faces.shape().size("x"), 3);
    EXPECT_DOUBLE_EQ(x_faces.value({{"b", 1}, {"x", 0}, {"y", 0}}), 2.0);
}

TEST_F(FieldMathTest, StackRequiresMatchingFields) {
    Field a(grid, ramp, ZERO_GRADIENT);
    EXPECT_THROW(stack({a, Field(grid, ramp, ONE)}, batch("b", 2)), NotImplementedException);
    EXPECT_THROW(stack({a, a.at_faces()}, batch("b", 2)), InvalidArgumentException);
    EXPECT_THROW(stack({}, batch("b", 0)), InvalidArgumentException);
}

// ============================================================================
// concat
// ============================================================================

TEST_F(FieldMathTest, ConcatPointClouds) {
    Field a = cloud({0, 0, 1, 1}, {1, 2});
    Field b = cloud({5, 5}, {3});
    Field c = concat({a, b}, "points");
    EXPECT_EQ(c.geometry()->shape().size("points"), 3);
    EXPECT_EQ(c.values().to_vector(), (std::vector<Real>{1, 2, 3}));
    EXPECT_NEAR(c.geometry()->center().value({{"points", 2}, {"vector", 1}}), 5.0, tol);
}

TEST_F(FieldMathTest, ConcatSpheres) {
    auto s1 = std::make_shared<const geometry::Sphere>(
        Tensor::from_values(Shape{instance("points", 1), vector_dim({"x", "y"})}, {0, 0}), Tensor(Real(1)));
    auto s2 = std::make_shared<const geometry::Sphere>(
        Tensor::from_values(Shape{instance("points", 2), vector_dim({"x", "y"})}, {3, 0, 6, 0}), Tensor(Real(2)));
    Field a(s1, Tensor(Real(1)));
    Field b(s2, Tensor(Real(2)));
    Field c = concat({a, b}, "points");
    ASSERT_EQ(c.geometry()->type(), GeometryType::Sphere);
    const auto& sphere = static_cast<const geometry::Sphere&>(*c.geometry());
    EXPECT_EQ(sphere.radius().to_vector(), (std::vector<Real>{1, 2, 2}));
    EXPECT_EQ(c.values().to_vector(), (std::vector<Real>{1, 2, 2}));
}

TEST_F(FieldMathTest, ConcatOtherGeometriesIsNotImplemented) {
    Field a(grid, ramp);
    EXPECT_THROW(concat({a, a}, "x"), NotImplementedException);
    EXPECT_THROW(concat({cloud({0, 0}, {1}), cloud({1, 1}, {2})}, "cells"), ShapeMismatchException);
}

// ============================================================================
// pad
// ============================================================================

TEST_F(FieldMathTest, PadCenteredGrid) {
    Field f(grid, ramp, ZERO_GRADIENT);
    Field p = pad(f, 1);
    EXPECT_EQ(p.resolution(), (Shape{spatial("x", 6)}));
    EXPECT_NEAR(p.bounds()->lower().item(), -1.0, tol);
    EXPECT_NEAR(p.bounds()->upper().item(), 5.0, tol);
    EXPECT_EQ(p.values().to_vector(), (std::vector<Real>{1, 1, 2, 3, 4, 4}));
}

TEST_F(FieldMathTest, PadOneSide) {
    Field f(grid, ramp, constant(9.0));
    Field p = pad(f, extrapolation::PadWidths{{"x", {0, 2}}});
    EXPECT_EQ(p.values().to_vector(), (std::vector<Real>{1, 2, 3, 4, 9, 9}));
    EXPECT_NEAR(p.bounds()->lower().item(), 0.0, tol);
}

TEST_F(FieldMathTest, PadStaggeredGrid) {
    Field f(grid, [](const Tensor& p) { return p * Tensor(Real(2)); }, ZERO, SampleLocation::Face);
    Field p = pad(f, 1);
    ASSERT_TRUE(p.is_staggered());
    EXPECT_EQ(p.values().to_vector(), (std::vector<Real>{0, 2, 4, 6, 0}));
}

TEST_F(FieldMathTest, PadNeedsAGrid) {
    EXPECT_THROW(pad(cloud({0, 0}, {1}), 1), NotImplementedException);
}
