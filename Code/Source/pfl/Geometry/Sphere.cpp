/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Geometry/Sphere.h"
#include "pfl/Core/PFLConfig.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/VectorOps.h"

namespace pfl {
namespace geometry {

Sphere::Sphere(math::Tensor center, math::Tensor radius)
    : center_(std::move(center)), radius_(std::move(radius)) {
    PFL_CHECK_ARG(center_.shape().contains(dims::VECTOR), "Sphere center needs a 'vector' dimension");
    PFL_CHECK_ARG(!radius_.shape().contains(dims::VECTOR), "Sphere radius must not have a 'vector' dimension");
}

math::Shape Sphere::compute_shape() const {
    return fill_spatial_with_singleton(center_.shape() & radius_.shape()).without(dims::VECTOR);
}

math::Tensor Sphere::volume() const {
    return volume_.get([this]() { return ball_volume(radius_, spatial_rank()); });
}

math::Tensor Sphere::lies_inside(const math::Tensor& location) const {
    math::Tensor distance_squared = math::vec_squared(location - center_);
    return math::binary(distance_squared, radius_ * radius_, math::BinaryOp::LessEqual)
        .any(instance_names(shape()));
}

math::Tensor Sphere::approximate_signed_distance(const math::Tensor& location) const {
    math::Tensor distance_squared = math::vec_squared(location - center_);
    distance_squared = math::maximum(distance_squared, radius_ * config::SDF_CENTER_CLAMP);
    return (math::sqrt(distance_squared) - radius_).min(instance_names(shape()));
}

ClosestSurface Sphere::approximate_closest_surface(const math::Tensor& location) const {
    math::Tensor center_delta = center_ - location;
    math::Tensor center_distance = math::vec_length(center_delta);
    math::Tensor normal = math::vec_normalize(-center_delta);
    math::Tensor surface = center_ + normal * radius_;

    ClosestSurface pieces;
    pieces.signed_distance = center_distance - radius_;
    pieces.delta = surface - location;
    pieces.normal = normal;
    return closest_of(pieces, instance_names(shape()));
}

math::Tensor Sphere::bounding_half_extent() const {
    return radius_.expand(math::Shape{math::vector_dim(vector_axes())});
}

GeometryPtr Sphere::at(const math::Tensor& center) const {
    return std::make_shared<const Sphere>(center, radius_);
}

GeometryPtr Sphere::scaled(const math::Tensor& factor) const {
    return std::make_shared<const Sphere>(center_, radius_ * factor);
}

GeometryPtr Sphere::slice(const math::Selection& selection) const {
    math::Selection sel = without_vector(selection);
    return std::make_shared<const Sphere>(center_.slice(sel), radius_.slice(sel));
}

bool Sphere::equals(const Geometry& other) const {
    if (other.type() != GeometryType::Sphere) {
        return false;
    }
    const auto& sphere = static_cast<const Sphere&>(other);
    return shape() == sphere.shape() && math::close(center_, sphere.center_) &&
           math::close(radius_, sphere.radius_);
}

std::string Sphere::to_string() const {
    return "Sphere(center=" + center_.to_string() + ", radius=" + radius_.to_string() + ")";
}

} // namespace geometry
} // namespace pfl
