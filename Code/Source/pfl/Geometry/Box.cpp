/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Geometry/Box.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/VectorOps.h"

#include <random>

namespace pfl {
namespace geometry {

Box::Box(math::Tensor lower, math::Tensor upper, std::optional<math::Tensor> rotation)
    : lower_(std::move(lower)), upper_(std::move(upper)) {
    PFL_CHECK_ARG(lower_.shape().contains(dims::VECTOR) && upper_.shape().contains(dims::VECTOR),
                  "Box corners need a 'vector' dimension");
    PFL_CHECK_ARG(lower_.shape().item_names(dims::VECTOR) == upper_.shape().item_names(dims::VECTOR),
                  "Box corners must list the same axes");
    if (rotation) {
        rotation_ = math::rotation_matrix(*rotation, lower_.shape().item_names(dims::VECTOR));
    }
}

BoxPtr Box::from_size(const std::vector<std::string>& axes, const std::vector<Real>& size) {
    PFL_CHECK_ARG(axes.size() == size.size(), "Box::from_size needs one size per axis");
    return std::make_shared<const Box>(math::Tensor::vector(axes, std::vector<Real>(axes.size(), Real(0))),
                                       math::Tensor::vector(axes, size));
}

BoxPtr Box::cuboid(const math::Tensor& center, const math::Tensor& half_size,
                   std::optional<math::Tensor> rotation) {
    return std::make_shared<const Box>(center - half_size, center + half_size, std::move(rotation));
}

math::Shape Box::compute_shape() const {
    math::Shape shape = (lower_.shape() & upper_.shape()).without(dims::VECTOR);
    if (rotation_) {
        shape = shape & rotation_->shape().without(std::vector<std::string>{dims::VECTOR, dims::DUAL_VECTOR});
    }
    return shape;
}

math::Tensor Box::unrotate(const math::Tensor& location) const {
    if (!rotation_) {
        return location;
    }
    const math::Tensor c = center();
    return c + math::rotate_vector(location - c, rotation_, true);
}

math::Tensor Box::volume() const {
    return vector_product(size());
}

math::Tensor Box::lies_inside(const math::Tensor& global) const {
    const math::Tensor location = unrotate(global);
    math::Tensor inside = math::binary(location, lower_, math::BinaryOp::GreaterEqual) *
                          math::binary(location, upper_, math::BinaryOp::LessEqual);
    return inside.all({dims::VECTOR}).any(instance_names(shape()));
}

math::Tensor Box::approximate_signed_distance(const math::Tensor& location) const {
    math::Tensor distance = math::abs(unrotate(location) - center()) - half_size();
    return distance.max({dims::VECTOR}).min(instance_names(shape()));
}

ClosestSurface Box::approximate_closest_surface(const math::Tensor& global) const {
    const math::Tensor location = unrotate(global);
    const auto axes = vector_axes();
    math::Tensor rel = location - center();
    math::Tensor side = math::where(math::binary(rel, Real(0), math::BinaryOp::GreaterEqual), Real(1), Real(-1));
    math::Tensor per_axis = math::abs(rel) - half_size();
    math::Tensor inner_distance = per_axis.max({dims::VECTOR});

    // Inside: leave through the face along the axis with the largest distance
    math::Tensor axis = math::argmin(-per_axis, dims::VECTOR);
    math::Tensor one_hot = math::less(math::abs(math::Tensor::arange(math::vector_dim(axes)) - axis), Real(0.5));
    math::Tensor inner_normal = one_hot * side;
    math::Tensor inner_delta = inner_normal * (-inner_distance);

    // Outside: closest point is the location clamped into the box
    math::Tensor clamped = math::maximum(math::minimum(location, upper_), lower_);
    math::Tensor outer_delta = clamped - location;
    math::Tensor outer_distance = math::vec_length(outer_delta);
    math::Tensor outer_normal = math::vec_normalize(location - clamped);

    math::Tensor inside = math::binary(inner_distance, Real(0), math::BinaryOp::LessEqual);
    ClosestSurface pieces;
    pieces.signed_distance = math::where(inside, inner_distance, outer_distance);
    pieces.delta = math::rotate_vector(math::where(inside, inner_delta, outer_delta), rotation_);
    pieces.normal = math::rotate_vector(math::where(inside, inner_normal, outer_normal), rotation_);
    return closest_of(pieces, instance_names(shape()));
}

math::Tensor Box::bounding_radius() const {
    return math::vec_length(half_size());
}

math::Tensor Box::bounding_half_extent() const {
    if (!rotation_) {
        return half_size();
    }
    // Half extent of the rotated corners along each global axis
    return math::matmul(math::abs(*rotation_), half_size());
}

GeometryPtr Box::at(const math::Tensor& center) const {
    return cuboid(center, half_size(), rotation_);
}

GeometryPtr Box::shifted(const math::Tensor& delta) const {
    return std::make_shared<const Box>(lower_ + delta, upper_ + delta, rotation_);
}

GeometryPtr Box::rotated(const math::Tensor& angle) const {
    if (!rotation_) {
        return std::make_shared<const Box>(lower_, upper_, angle);
    }
    math::Tensor matrix = math::matrix_product(*rotation_, math::rotation_matrix(angle, vector_axes()));
    return std::make_shared<const Box>(lower_, upper_, matrix);
}

GeometryPtr Box::scaled(const math::Tensor& factor) const {
    return cuboid(center(), half_size() * factor, rotation_);
}

GeometryPtr Box::slice(const math::Selection& selection) const {
    if (!rotation_) {
        return std::make_shared<const Box>(lower_.slice(selection), upper_.slice(selection));
    }
    PFL_THROW_IF(selection.count(dims::VECTOR) || selection.count(dims::DUAL_VECTOR), NotImplementedException,
                 "selecting axes of a rotated Box");
    return std::make_shared<const Box>(lower_.slice(selection), upper_.slice(selection), rotation_->slice(selection));
}

math::Tensor Box::sample_uniform(const math::Shape& samples) const {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_real_distribution<Real> uniform(Real(0), Real(1));

    math::Shape shape = samples & this->shape() & math::Shape{math::vector_dim(vector_axes())};
    Eigen::ArrayXd data(shape.volume());
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        data[i] = uniform(engine);
    }
    return local_to_global(math::Tensor(shape, std::move(data)));
}

math::Tensor Box::global_to_local(const math::Tensor& global) const {
    return (unrotate(global) - lower_) / size();
}

math::Tensor Box::local_to_global(const math::Tensor& local) const {
    math::Tensor aligned = lower_ + local * size();
    if (!rotation_) {
        return aligned;
    }
    const math::Tensor c = center();
    return c + math::rotate_vector(aligned - c, rotation_);
}

bool Box::equals(const Geometry& other) const {
    if (other.type() != GeometryType::Box) {
        return false;
    }
    const auto& box = static_cast<const Box&>(other);
    if (shape() != box.shape()) {
        return false;
    }
    if (rotation_ || box.rotation_) {
        const math::Tensor identity = math::identity_matrix(vector_axes());
        if (!math::close(rotation_.value_or(identity), box.rotation_.value_or(identity))) {
            return false;
        }
    }
    return math::close(lower_, box.lower_) && math::close(upper_, box.upper_);
}

std::string Box::to_string() const {
    return "Box(lower=" + lower_.to_string() + ", upper=" + upper_.to_string() + (rotation_ ? ", rotated" : "") +
           ")";
}

} // namespace geometry
} // namespace pfl
