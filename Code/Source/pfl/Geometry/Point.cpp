/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Geometry/Point.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/VectorOps.h"

namespace pfl {
namespace geometry {

Point::Point(math::Tensor location)
    : location_(std::move(location)) {
    PFL_CHECK_ARG(location_.shape().contains(dims::VECTOR), "Point location needs a 'vector' dimension");
}

math::Tensor Point::lies_inside(const math::Tensor& location) const {
    return math::Tensor::zeros(location.shape().without(dims::VECTOR));
}

math::Tensor Point::approximate_signed_distance(const math::Tensor& location) const {
    return math::vec_length(location - location_).min(instance_names(shape()));
}

ClosestSurface Point::approximate_closest_surface(const math::Tensor& location) const {
    ClosestSurface pieces;
    pieces.delta = location_ - location;
    pieces.signed_distance = math::vec_length(pieces.delta);
    pieces.normal = math::vec_normalize(-pieces.delta);
    return closest_of(pieces, instance_names(shape()));
}

math::Tensor Point::bounding_half_extent() const {
    return math::Tensor::zeros(math::Shape{math::vector_dim(vector_axes())});
}

GeometryPtr Point::at(const math::Tensor& center) const {
    return std::make_shared<const Point>(center);
}

GeometryPtr Point::slice(const math::Selection& selection) const {
    return std::make_shared<const Point>(location_.slice(without_vector(selection)));
}

bool Point::equals(const Geometry& other) const {
    if (other.type() != GeometryType::Point) {
        return false;
    }
    const auto& point = static_cast<const Point&>(other);
    return shape() == point.shape() && math::close(location_, point.location_);
}

std::string Point::to_string() const {
    return "Point(" + location_.to_string() + ")";
}

} // namespace geometry
} // namespace pfl
