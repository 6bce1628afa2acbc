/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_GEOMETRY_SPHERE_H
#define PFL_GEOMETRY_SPHERE_H

/**
 * @file Sphere.h
 * @brief N-dimensional sphere (disc in 2D, interval in 1D)
 */

#include "pfl/Geometry/Geometry.h"

namespace pfl {
namespace geometry {

class Sphere : public Geometry {
public:
    Sphere(math::Tensor center, math::Tensor radius);

    GeometryType type() const noexcept override { return GeometryType::Sphere; }

    math::Tensor center() const override { return center_; }
    const math::Tensor& radius() const noexcept { return radius_; }

    math::Tensor volume() const override;
    math::Tensor lies_inside(const math::Tensor& location) const override;

    /**
     * @brief Distance to the surface, negative inside
     *
     * The squared distance is clamped to at least radius * SDF_CENTER_CLAMP
     * before the square root so that the value and its gradient stay finite
     * at the center.
     */
    math::Tensor approximate_signed_distance(const math::Tensor& location) const override;
    ClosestSurface approximate_closest_surface(const math::Tensor& location) const override;

    math::Tensor bounding_radius() const override { return radius_; }
    math::Tensor bounding_half_extent() const override;

    GeometryPtr at(const math::Tensor& center) const override;
    /// Spheres are rotation invariant
    GeometryPtr rotated(const math::Tensor&) const override { return ptr(); }
    GeometryPtr scaled(const math::Tensor& factor) const override;
    GeometryPtr slice(const math::Selection& selection) const override;

    bool equals(const Geometry& other) const override;
    std::string to_string() const override;

protected:
    math::Shape compute_shape() const override;

private:
    math::Tensor center_;
    math::Tensor radius_;
    Memoized<math::Tensor> volume_;
};

} // namespace geometry
} // namespace pfl

#endif // PFL_GEOMETRY_SPHERE_H
