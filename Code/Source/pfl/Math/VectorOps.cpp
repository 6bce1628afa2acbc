/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Math/VectorOps.h"
#include "pfl/Core/PFLException.h"

#include <Eigen/Geometry>

namespace pfl {
namespace math {

namespace {

const std::string kColumns = "_columns";

/**
 * @brief Build a (batch..., vector, ~vector) tensor from per-element matrices
 *
 * `matrix_at` receives the flat batch index and returns a d x d matrix.
 */
template<typename MatrixAt>
Tensor batched_matrices(const Shape& batch, const std::vector<std::string>& axes, MatrixAt&& matrix_at) {
    const Index d = static_cast<Index>(axes.size());
    std::vector<Dim> dims = batch.dims();
    dims.push_back(vector_dim(axes));
    dims.push_back(channel(kColumns, axes));
    Shape shape(dims);
    Index n = batch.volume();
    Eigen::ArrayXd data(n * d * d);
    for (Index k = 0; k < n; ++k) {
        Eigen::MatrixXd m = matrix_at(k);
        for (Index r = 0; r < d; ++r) {
            for (Index c = 0; c < d; ++c) {
                data[(k * d + r) * d + c] = m(r, c);
            }
        }
    }
    return Tensor(shape, std::move(data)).rename(kColumns, dims::DUAL_VECTOR);
}

} // namespace

Tensor vec(const std::vector<std::string>& axes, const std::vector<Tensor>& components) {
    PFL_CHECK_ARG(axes.size() == components.size(), "vec() needs one component per axis");
    return Tensor::stack(components, vector_dim(axes));
}

Tensor vec_squared(const Tensor& v) {
    return (v * v).sum({dims::VECTOR});
}

Tensor vec_length(const Tensor& v) {
    return sqrt(vec_squared(v));
}

Tensor vec_normalize(const Tensor& v, Real epsilon) {
    return v / maximum(vec_length(v), Tensor(epsilon));
}

Tensor dot(const Tensor& a, const Tensor& b) {
    return (a * b).sum({dims::VECTOR});
}

Tensor identity_matrix(const std::vector<std::string>& axes) {
    const auto d = static_cast<Eigen::Index>(axes.size());
    return batched_matrices(Shape{}, axes, [d](Index) -> Eigen::MatrixXd {
        return Eigen::MatrixXd::Identity(d, d);
    });
}

Tensor rotation_matrix(const Tensor& angle, const std::vector<std::string>& axes) {
    if (angle.shape().contains(dims::DUAL_VECTOR)) {
        return angle;
    }
    if (axes.size() == 2) {
        PFL_CHECK_SHAPE(!angle.shape().contains(dims::VECTOR), "2D rotations take a scalar angle");
        Eigen::ArrayXd theta = angle.to_array();
        return batched_matrices(angle.shape(), axes, [&theta](Index k) -> Eigen::MatrixXd {
            return Eigen::Rotation2Dd(theta[k]).toRotationMatrix();
        });
    }
    if (axes.size() == 3) {
        PFL_CHECK_SHAPE(angle.shape().contains(dims::VECTOR) && angle.shape().size(dims::VECTOR) == 3,
                        "3D rotations take a rotation vector with three components");
        Shape batch = angle.shape().without(dims::VECTOR);
        std::vector<std::string> order = batch.names();
        order.push_back(dims::VECTOR);
        Eigen::ArrayXd rv = angle.to_array(order);
        return batched_matrices(batch, axes, [&rv](Index k) -> Eigen::MatrixXd {
            Eigen::Vector3d r(rv[3 * k], rv[3 * k + 1], rv[3 * k + 2]);
            Real theta = r.norm();
            if (theta == 0) {
                return Eigen::Matrix3d::Identity();
            }
            return Eigen::AngleAxisd(theta, r / theta).toRotationMatrix();
        });
    }
    PFL_THROW(InvalidArgumentException,
              "Rotations are defined in 2D and 3D, got " + std::to_string(axes.size()) + " axes");
}

Tensor transpose_matrix(const Tensor& matrix) {
    return matrix.rename(dims::VECTOR, kColumns)
        .rename(dims::DUAL_VECTOR, dims::VECTOR)
        .rename(kColumns, dims::DUAL_VECTOR);
}

Tensor matmul(const Tensor& matrix, const Tensor& v) {
    PFL_CHECK_SHAPE(matrix.shape().contains(dims::DUAL_VECTOR), "matmul requires a matrix with '~vector'");
    return (matrix * v.rename(dims::VECTOR, dims::DUAL_VECTOR)).sum({dims::DUAL_VECTOR});
}

Tensor matrix_product(const Tensor& a, const Tensor& b) {
    PFL_CHECK_SHAPE(a.shape().contains(dims::DUAL_VECTOR) && b.shape().contains(dims::DUAL_VECTOR),
                    "matrix_product requires two matrices with '~vector'");
    // Columns of b move aside so that its rows can be contracted with the columns of a
    Tensor rhs = b.rename(dims::DUAL_VECTOR, kColumns).rename(dims::VECTOR, dims::DUAL_VECTOR);
    return (a * rhs).sum({dims::DUAL_VECTOR}).rename(kColumns, dims::DUAL_VECTOR);
}

Tensor rotate_vector(const Tensor& v, const std::optional<Tensor>& rotation, bool invert) {
    if (!rotation) {
        return v;
    }
    return matmul(invert ? transpose_matrix(*rotation) : *rotation, v);
}

Tensor argmin(const Tensor& key, const std::string& dim) {
    if (!key.shape().contains(dim)) {
        return Tensor(Real(0));
    }
    Index n = key.shape().size(dim);
    Tensor best = key.slice(Selection{{dim, Index(0)}});
    Tensor idx(Real(0));
    for (Index i = 1; i < n; ++i) {
        Tensor ki = key.slice(Selection{{dim, i}});
        Tensor better = less(ki, best);
        idx = where(better, Tensor(static_cast<Real>(i)), idx);
        best = where(better, ki, best);
    }
    return idx;
}

Tensor at_min(const Tensor& value, const Tensor& key, const std::string& dim) {
    if (!value.shape().contains(dim)) {
        return value;
    }
    Tensor idx = argmin(key, dim);
    Index n = value.shape().size(dim);
    Tensor result = value.slice(Selection{{dim, Index(0)}});
    for (Index i = 1; i < n; ++i) {
        Tensor hit = less(abs(idx - Tensor(static_cast<Real>(i))), Tensor(Real(0.5)));
        result = where(hit, value.slice(Selection{{dim, i}}), result);
    }
    return result;
}

} // namespace math
} // namespace pfl
