/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_GEOMETRY_POINT_H
#define PFL_GEOMETRY_POINT_H

/**
 * @file Point.h
 * @brief Zero-volume points, used for point clouds and sample locations
 */

#include "pfl/Geometry/Geometry.h"

namespace pfl {
namespace geometry {

class Point : public Geometry {
public:
    explicit Point(math::Tensor location);

    GeometryType type() const noexcept override { return GeometryType::Point; }

    math::Tensor center() const override { return location_; }

    math::Tensor volume() const override { return math::Tensor(Real(0)); }
    /// Points contain nothing
    math::Tensor lies_inside(const math::Tensor& location) const override;
    /// Distance to the nearest point; never negative
    math::Tensor approximate_signed_distance(const math::Tensor& location) const override;
    ClosestSurface approximate_closest_surface(const math::Tensor& location) const override;
    math::Tensor bounding_radius() const override { return math::Tensor(Real(0)); }
    math::Tensor bounding_half_extent() const override;

    GeometryPtr at(const math::Tensor& center) const override;
    GeometryPtr rotated(const math::Tensor&) const override { return ptr(); }
    GeometryPtr scaled(const math::Tensor&) const override { return ptr(); }
    GeometryPtr slice(const math::Selection& selection) const override;

    bool equals(const Geometry& other) const override;
    std::string to_string() const override;

protected:
    math::Shape compute_shape() const override { return location_.shape().without(dims::VECTOR); }

private:
    math::Tensor location_;
};

} // namespace geometry
} // namespace pfl

#endif // PFL_GEOMETRY_POINT_H
