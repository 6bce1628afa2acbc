/**
 * @file test_DifferentialOperators.cpp
 * @brief Unit tests for finite-difference gradient, divergence, curl, laplace and downsampling
 */

#include <gtest/gtest.h>
#include "pfl/Field/DifferentialOperators.h"
#include "pfl/Field/Field.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Extrapolation/Constants.h"
#include "pfl/Geometry/UniformGrid.h"
#include "pfl/Math/VectorOps.h"

using namespace pfl;
using namespace pfl::math;
using namespace pfl::field;
using namespace pfl::extrapolation;
using geometry::Box;
using geometry::UniformGrid;

namespace {
constexpr double tol = 1e-12;

Tensor coord(const Tensor& p, const std::string& name) {
    return p.slice(Selection{{"vector", name}});
}

/// Counts laplace() calls before delegating to finite differences
class CountingOperators : public FiniteDifferenceOperators {
public:
    Field laplace(const Field& field, const std::vector<std::string>& dims, int order) const override {
        ++calls;
        return FiniteDifferenceOperators::laplace(field, dims, order);
    }

    mutable int calls = 0;
};
} // namespace

class DifferentialOperatorsTest : public ::testing::Test {
protected:
    std::shared_ptr<const UniformGrid> grid = std::make_shared<const UniformGrid>(Shape{spatial("x", 4)},
                                                                                  Box::from_size({"x"}, {4}));
    std::shared_ptr<const UniformGrid> plane = std::make_shared<const UniformGrid>(
        Shape{spatial("x", 4), spatial("y", 3)}, Box::from_size({"x", "y"}, {4, 3}));
    // f(x) = 2x at the cell centers
    Field linear{grid, Tensor::from_values(Shape{spatial("x", 4)}, {1, 3, 5, 7}), ZERO_GRADIENT};
};

TEST_F(DifferentialOperatorsTest, CenteredGradient) {
    Field g = linear.gradient();
    ASSERT_TRUE(g.values().shape().contains("vector"));
    EXPECT_NEAR(g.values().value({{"x", 1}, {"vector", 0}}), 2.0, tol);
    EXPECT_NEAR(g.values().value({{"x", 2}, {"vector", 0}}), 2.0, tol);
    // Zero-gradient neighbours halve the slope at the ends
    EXPECT_NEAR(g.values().value({{"x", 0}, {"vector", 0}}), 1.0, tol);
    EXPECT_TRUE(same(g.boundary(), ZERO));
}

TEST_F(DifferentialOperatorsTest, FaceGradient) {
    GradientOptions options;
    options.at = SampleLocation::Face;
    Field g = linear.gradient(options);
    ASSERT_TRUE(g.is_staggered());
    EXPECT_EQ(g.values().to_vector(), (std::vector<Real>{2, 2, 2}));
}

TEST_F(DifferentialOperatorsTest, GradientWithExplicitRule) {
    GradientOptions options;
    options.boundary = ZERO_GRADIENT;
    EXPECT_TRUE(same(linear.gradient(options).boundary(), ZERO_GRADIENT));
}

TEST_F(DifferentialOperatorsTest, GradientAlongOneAxis) {
    Field f(plane, [](const Tensor& p) { return coord(p, "x") * Tensor(Real(3)) + coord(p, "y"); }, ZERO_GRADIENT);
    GradientOptions options;
    options.dims = {"y"};
    Field g = f.gradient(options);
    EXPECT_EQ(g.values().shape().item_names("vector"), (std::vector<std::string>{"y"}));
    EXPECT_NEAR(g.values().value({{"x", 2}, {"y", 1}, {"vector", 0}}), 1.0, tol);
    EXPECT_NEAR(f.gradient().values().value({{"x", 2}, {"y", 1}, {"vector", 0}}), 3.0, tol);
}

TEST_F(DifferentialOperatorsTest, DivergenceOfCenteredVectors) {
    Field v(grid, Tensor::from_values(Shape{spatial("x", 4), vector_dim({"x"})}, {1, 3, 5, 7}), ZERO_GRADIENT);
    Field div = v.divergence();
    EXPECT_FALSE(div.values().shape().contains("vector"));
    EXPECT_NEAR(div.values().value({{"x", 1}}), 2.0, tol);
    EXPECT_NEAR(div.values().value({{"x", 2}}), 2.0, tol);
    EXPECT_THROW(linear.divergence(), InvalidArgumentException);
}

TEST_F(DifferentialOperatorsTest, DivergenceOfStaggeredField) {
    Field v(grid, [](const Tensor& p) { return p * Tensor(Real(2)); }, ZERO_GRADIENT, SampleLocation::Face);
    ASSERT_TRUE(v.is_staggered());
    Field div = v.divergence();
    EXPECT_TRUE(div.is_centered());
    EXPECT_TRUE(close(div.values(), Tensor::full(Shape{spatial("x", 4)}, 2)));
}

TEST_F(DifferentialOperatorsTest, CurlOfRotation) {
    // v = (-y, x) has curl 2
    Field v(plane, [](const Tensor& p) { return vec({"x", "y"}, {-coord(p, "y"), coord(p, "x")}); }, ZERO_GRADIENT,
            SampleLocation::Face);
    Field c = v.curl();
    EXPECT_EQ(c.resolution(), (Shape{spatial("x", 5), spatial("y", 4)}));
    EXPECT_NEAR(c.bounds()->lower().value({{"vector", 0}}), -0.5, tol);
    EXPECT_NEAR(c.values().value({{"x", 2}, {"y", 2}}), 2.0, tol);
    EXPECT_NEAR(c.values().value({{"x", 1}, {"y", 1}}), 2.0, tol);
    EXPECT_THROW(linear.curl(), NotImplementedException);
}

TEST_F(DifferentialOperatorsTest, LaplaceOfQuadratic) {
    Field f(grid, [](const Tensor& p) { return coord(p, "x") * coord(p, "x"); }, ZERO_GRADIENT);
    Field l = f.laplace();
    EXPECT_NEAR(l.values().value({{"x", 1}}), 2.0, tol);
    EXPECT_NEAR(l.values().value({{"x", 2}}), 2.0, tol);
}

TEST_F(DifferentialOperatorsTest, HigherOrdersAreNotImplemented) {
    GradientOptions options;
    options.order = 4;
    EXPECT_THROW(linear.gradient(options), NotImplementedException);
    EXPECT_THROW(linear.laplace({}, 4), NotImplementedException);
    EXPECT_THROW(linear.divergence(6), NotImplementedException);
}

TEST_F(DifferentialOperatorsTest, Downsample) {
    Field coarse = linear.downsample(2);
    EXPECT_EQ(coarse.resolution(), (Shape{spatial("x", 2)}));
    EXPECT_EQ(coarse.values().to_vector(), (std::vector<Real>{2, 6}));
    EXPECT_TRUE(close(coarse.dx(), Tensor::vector({"x"}, {2})));
    EXPECT_EQ(linear.downsample(4).values().to_vector(), (std::vector<Real>{4}));
    EXPECT_TRUE(linear.downsample(1) == linear);
    EXPECT_THROW(linear.downsample(3), NotImplementedException);

    auto odd = std::make_shared<const UniformGrid>(Shape{spatial("x", 3)}, Box::from_size({"x"}, {3}));
    EXPECT_THROW(Field(odd, Tensor(Real(1))).downsample(2), InvalidArgumentException);
}

TEST_F(DifferentialOperatorsTest, DownsampleStaggered) {
    Field v(grid, [](const Tensor& p) { return p; }, ZERO, SampleLocation::Face);
    Field coarse = v.downsample(2);
    ASSERT_TRUE(coarse.is_staggered());
    EXPECT_EQ(coarse.values().to_vector(), (std::vector<Real>{2}));
}

TEST_F(DifferentialOperatorsTest, ReplacingTheOperators) {
    auto counting = std::make_shared<CountingOperators>();
    set_differential_operators(counting);
    linear.laplace();
    EXPECT_EQ(counting->calls, 1);
    set_differential_operators(nullptr);
    linear.laplace();
    EXPECT_EQ(counting->calls, 1);
    EXPECT_NE(differential_operators(), nullptr);
}
