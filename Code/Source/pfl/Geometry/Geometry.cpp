/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Geometry/Geometry.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/MathConstants.h"
#include "pfl/Math/VectorOps.h"

namespace pfl {
namespace geometry {

const char* to_string(GeometryType type) {
    switch (type) {
        case GeometryType::UniformGrid: return "UniformGrid";
        case GeometryType::Mesh:        return "Mesh";
        case GeometryType::Box:         return "Box";
        case GeometryType::Sphere:      return "Sphere";
        case GeometryType::Cylinder:    return "Cylinder";
        case GeometryType::Point:       return "Point";
        case GeometryType::Stack:       return "GeometryStack";
        default:                        return "Unknown";
    }
}

const math::Shape& Geometry::shape() const {
    return shape_.get([this]() { return compute_shape(); });
}

std::vector<std::string> Geometry::vector_axes() const {
    math::Tensor c = center();
    PFL_THROW_IF(!c.shape().contains(dims::VECTOR), ShapeMismatchException,
                 std::string(geometry::to_string(type())) + " center has no 'vector' dimension");
    return c.shape().item_names(dims::VECTOR);
}

ClosestSurface Geometry::approximate_closest_surface(const math::Tensor&) const {
    PFL_NOT_IMPLEMENTED(std::string("approximate_closest_surface for ") + geometry::to_string(type()));
}

GeometryPtr Geometry::shifted(const math::Tensor& delta) const {
    return at(center() + delta);
}

math::Tensor Geometry::sample_uniform(const math::Shape&) const {
    PFL_NOT_IMPLEMENTED(std::string("sample_uniform for ") + geometry::to_string(type()));
}

GeometryPtr Geometry::faces() const {
    PFL_NOT_IMPLEMENTED(std::string("faces of ") + geometry::to_string(type()));
}

math::Tensor Geometry::face_centers() const {
    PFL_NOT_IMPLEMENTED(std::string("face_centers of ") + geometry::to_string(type()));
}

math::Tensor Geometry::face_areas() const {
    PFL_NOT_IMPLEMENTED(std::string("face_areas of ") + geometry::to_string(type()));
}

math::Tensor Geometry::face_normals() const {
    PFL_NOT_IMPLEMENTED(std::string("face_normals of ") + geometry::to_string(type()));
}

math::Shape Geometry::face_shape() const {
    PFL_NOT_IMPLEMENTED(std::string("face_shape of ") + geometry::to_string(type()));
}

std::string Geometry::to_string() const {
    return std::string(geometry::to_string(type())) + shape().to_string();
}

bool same(const GeometryPtr& a, const GeometryPtr& b) {
    if (a == b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return a->equals(*b);
}

math::Shape fill_spatial_with_singleton(const math::Shape& shape) {
    if (!shape.contains(dims::VECTOR)) {
        return shape;
    }
    const auto& axes = shape.item_names(dims::VECTOR);
    if (static_cast<std::size_t>(shape.spatial().rank()) == axes.size()) {
        return shape;
    }
    math::Shape result = shape;
    for (const auto& axis : axes) {
        if (!result.contains(axis)) {
            result = result.with_dim(math::spatial(axis, 1));
        }
    }
    return result;
}

math::Selection without_vector(const math::Selection& selection) {
    math::Selection result = selection;
    result.erase(dims::VECTOR);
    return result;
}

math::Tensor vector_product(const math::Tensor& v) {
    if (!v.shape().contains(dims::VECTOR)) {
        return v;
    }
    math::Tensor result(Real(1));
    for (Index i = 0; i < v.shape().size(dims::VECTOR); ++i) {
        result = result * v.slice(math::Selection{{dims::VECTOR, i}});
    }
    return result;
}

math::Tensor ball_volume(const math::Tensor& radius, int rank) {
    switch (rank) {
        case 1: return radius * Real(2);
        case 2: return radius * radius * Real(math::constants::PI);
        case 3: return radius * radius * radius * Real(4.0 / 3.0 * math::constants::PI);
        default:
            PFL_THROW(InvalidArgumentException,
                      "Ball volume is defined for 1 to 3 dimensions, got " + std::to_string(rank));
    }
}

std::vector<std::string> instance_names(const math::Shape& shape) {
    return shape.instance().names();
}

ClosestSurface closest_of(const ClosestSurface& pieces, const std::vector<std::string>& dims) {
    ClosestSurface result = pieces;
    for (const auto& dim : dims) {
        const math::Tensor key = result.signed_distance;
        result.delta = math::at_min(result.delta, key, dim);
        result.normal = math::at_min(result.normal, key, dim);
        result.signed_distance = math::at_min(key, key, dim);
    }
    return result;
}

} // namespace geometry
} // namespace pfl
