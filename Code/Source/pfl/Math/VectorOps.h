/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_MATH_VECTOROPS_H
#define PFL_MATH_VECTOROPS_H

/**
 * @file VectorOps.h
 * @brief Vector algebra on named tensors
 *
 * Vectors carry their components along the channel dimension `vector`,
 * whose item names are the spatial axis names. Matrices map the dual
 * dimension `~vector` (columns) to `vector` (rows).
 */

#include "pfl/Math/Tensor.h"
#include <optional>

namespace pfl {
namespace math {

/// Stack per-axis components along `vector`
Tensor vec(const std::vector<std::string>& axes, const std::vector<Tensor>& components);

Tensor vec_squared(const Tensor& v);
Tensor vec_length(const Tensor& v);
/// v / max(|v|, epsilon)
Tensor vec_normalize(const Tensor& v, Real epsilon = config::NORMALIZE_EPSILON);
/// Sum of a * b over `vector`
Tensor dot(const Tensor& a, const Tensor& b);

/// Identity matrix over `axes`
Tensor identity_matrix(const std::vector<std::string>& axes);

/**
 * @brief Rotation matrix from an angle representation
 *
 * In 2D `angle` is a scalar angle (possibly batched). In 3D it is a
 * rotation vector along `vector` whose direction is the axis and whose
 * length is the angle. A tensor that already has a `~vector` dimension is
 * returned unchanged.
 */
Tensor rotation_matrix(const Tensor& angle, const std::vector<std::string>& axes);

/// Matrix-vector product contracting `~vector` of the matrix with `vector`
Tensor matmul(const Tensor& matrix, const Tensor& v);

/// Matrix product a @ b; both carry `vector` (rows) and `~vector` (columns)
Tensor matrix_product(const Tensor& a, const Tensor& b);

/**
 * @brief Rotate `v` by `rotation` or by its inverse
 *
 * Without a rotation `v` is returned unchanged.
 */
Tensor rotate_vector(const Tensor& v, const std::optional<Tensor>& rotation, bool invert = false);

/// Swap rows and columns of a matrix
Tensor transpose_matrix(const Tensor& matrix);

/// Index of the first minimum of `key` along `dim`
Tensor argmin(const Tensor& key, const std::string& dim);

/// Entries of `value` at the first minimum of `key` along `dim`
Tensor at_min(const Tensor& value, const Tensor& key, const std::string& dim);

} // namespace math
} // namespace pfl

#endif // PFL_MATH_VECTOROPS_H
