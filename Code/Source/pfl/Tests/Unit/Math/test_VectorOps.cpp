/**
 * @file test_VectorOps.cpp
 * @brief Unit tests for VectorOps.h - vector algebra and rotations
 */

#include <gtest/gtest.h>
#include "pfl/Math/VectorOps.h"
#include "pfl/Core/PFLException.h"
#include <cmath>

using namespace pfl;
using namespace pfl::math;

namespace {
constexpr double tol = 1e-12;
const double pi = std::acos(-1.0);
}

TEST(VectorOpsTest, LengthAndNormalize) {
    Tensor v = Tensor::vector({"x", "y"}, {3, 4});
    EXPECT_NEAR(vec_length(v).item(), 5.0, tol);
    Tensor n = vec_normalize(v);
    EXPECT_NEAR(n.value({{"vector", 0}}), 0.6, tol);
    Tensor zero = vec_normalize(Tensor::vector({"x", "y"}, {0, 0}));
    EXPECT_NEAR(vec_length(zero).item(), 0.0, tol);
}

TEST(VectorOpsTest, Rotation2D) {
    Tensor R = rotation_matrix(Tensor(pi / 2), {"x", "y"});
    EXPECT_TRUE(R.shape().contains("~vector"));
    Tensor r = rotate_vector(Tensor::vector({"x", "y"}, {1, 0}), R);
    EXPECT_NEAR(r.value({{"vector", 0}}), 0.0, tol);
    EXPECT_NEAR(r.value({{"vector", 1}}), 1.0, tol);

    Tensor back = rotate_vector(r, R, true);
    EXPECT_NEAR(back.value({{"vector", 0}}), 1.0, tol);
    EXPECT_NEAR(back.value({{"vector", 1}}), 0.0, tol);
}

TEST(VectorOpsTest, MatrixPassesThrough) {
    Tensor R = rotation_matrix(Tensor(0.3), {"x", "y"});
    Tensor same = rotation_matrix(R, {"x", "y"});
    EXPECT_TRUE(close(R, same));
}

TEST(VectorOpsTest, Rotation3DFromRotationVector) {
    Tensor R = rotation_matrix(Tensor::vector({"x", "y", "z"}, {0, 0, pi / 2}), {"x", "y", "z"});
    Tensor r = rotate_vector(Tensor::vector({"x", "y", "z"}, {1, 0, 0}), R);
    EXPECT_NEAR(r.value({{"vector", 0}}), 0.0, tol);
    EXPECT_NEAR(r.value({{"vector", 1}}), 1.0, tol);
    EXPECT_NEAR(r.value({{"vector", 2}}), 0.0, tol);

    Tensor I = rotation_matrix(Tensor::vector({"x", "y", "z"}, {0, 0, 0}), {"x", "y", "z"});
    EXPECT_TRUE(close(I, identity_matrix({"x", "y", "z"})));
}

TEST(VectorOpsTest, BatchedRotation) {
    Tensor angles = Tensor::from_values(Shape{batch("b", 2)}, {0, pi});
    Tensor R = rotation_matrix(angles, {"x", "y"});
    Tensor r = rotate_vector(Tensor::vector({"x", "y"}, {1, 0}), R);
    EXPECT_NEAR(r.value({{"b", 0}, {"vector", 0}}), 1.0, tol);
    EXPECT_NEAR(r.value({{"b", 1}, {"vector", 0}}), -1.0, tol);
}

TEST(VectorOpsTest, RotationRequiresTwoOrThreeAxes) {
    EXPECT_THROW(rotation_matrix(Tensor(1), {"x"}), InvalidArgumentException);
}

TEST(VectorOpsTest, NoRotationIsIdentity) {
    Tensor v = Tensor::vector({"x", "y"}, {1, 2});
    EXPECT_TRUE(close(rotate_vector(v, std::nullopt), v));
}

TEST(VectorOpsTest, AtMinPicksFirstMinimum) {
    Tensor key = Tensor::from_values(Shape{instance("shapes", 4)}, {3, 1, 1, 2});
    Tensor value = Tensor::from_values(Shape{instance("shapes", 4)}, {10, 20, 30, 40});
    EXPECT_DOUBLE_EQ(argmin(key, "shapes").item(), 1.0);
    EXPECT_DOUBLE_EQ(at_min(value, key, "shapes").item(), 20.0);
}

TEST(VectorOpsTest, AtMinPerPoint) {
    Tensor key = Tensor::from_values(Shape{instance("shapes", 2), spatial("x", 3)}, {0, 5, 1, 1, 2, 3});
    Tensor value = Tensor::from_values(Shape{instance("shapes", 2)}, {-1, 1});
    Tensor r = at_min(value, key, "shapes");
    EXPECT_EQ(r.to_vector(), (std::vector<Real>{-1, 1, -1}));
}

TEST(VectorOpsTest, MatrixProductComposesRotations) {
    Tensor a = rotation_matrix(Tensor(0.3), {"x", "y"});
    Tensor b = rotation_matrix(Tensor(0.4), {"x", "y"});
    EXPECT_TRUE(close(matrix_product(a, b), rotation_matrix(Tensor(0.7), {"x", "y"})));

    Tensor v = Tensor::vector({"x", "y"}, {1, 2});
    EXPECT_TRUE(close(rotate_vector(v, matrix_product(a, b)), rotate_vector(rotate_vector(v, b), a)));
}
