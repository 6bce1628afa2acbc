/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_GEOMETRY_CYLINDER_H
#define PFL_GEOMETRY_CYLINDER_H

/**
 * @file Cylinder.h
 * @brief Finite cylinder aligned with one axis and optionally rotated
 *
 * Queries rotate the location into the local frame of the cylinder, where
 * the alignment axis is `axis()` and the remaining axes are radial. The
 * lateral surface and the two caps are evaluated separately there.
 */

#include "pfl/Geometry/Geometry.h"

#include <optional>

namespace pfl {
namespace geometry {

class Cylinder : public Geometry {
public:
    /**
     * @param center   Center with a `vector` dimension
     * @param radius   Radius, must not vary along `vector`
     * @param depth    Length along the alignment axis
     * @param rotation Rotation angle, rotation vector or matrix; none for unrotated
     * @param axis     Alignment axis, one of the center's vector items
     */
    Cylinder(math::Tensor center, math::Tensor radius, math::Tensor depth,
             std::optional<math::Tensor> rotation, std::string axis);

    GeometryType type() const noexcept override { return GeometryType::Cylinder; }

    math::Tensor center() const override { return center_; }
    const math::Tensor& radius() const noexcept { return radius_; }
    const math::Tensor& depth() const noexcept { return depth_; }
    /// Rotation matrix, if rotated
    const std::optional<math::Tensor>& rotation() const noexcept { return rotation_; }
    const std::string& axis() const noexcept { return axis_; }
    const std::vector<std::string>& radial_axes() const noexcept { return radial_axes_; }

    /// Unit vector along the alignment axis in the global frame
    const math::Tensor& up() const;

    math::Tensor volume() const override;
    math::Tensor lies_inside(const math::Tensor& location) const override;
    math::Tensor approximate_signed_distance(const math::Tensor& location) const override;
    ClosestSurface approximate_closest_surface(const math::Tensor& location) const override;
    math::Tensor bounding_radius() const override;
    math::Tensor bounding_half_extent() const override;

    GeometryPtr at(const math::Tensor& center) const override;
    /// Composes with the existing rotation by matrix multiplication
    GeometryPtr rotated(const math::Tensor& angle) const override;
    GeometryPtr scaled(const math::Tensor& factor) const override;
    GeometryPtr slice(const math::Selection& selection) const override;

    /// Bottom, top and lateral shell
    math::Shape face_shape() const override;

    bool equals(const Geometry& other) const override;
    std::string to_string() const override;

protected:
    math::Shape compute_shape() const override;

private:
    /// Vector with `axial` along the alignment axis and `radial` on the others
    math::Tensor assemble(const math::Tensor& axial, const math::Tensor& radial) const;

    math::Tensor center_;
    math::Tensor radius_;
    math::Tensor depth_;
    std::optional<math::Tensor> rotation_;
    std::string axis_;
    std::vector<std::string> radial_axes_;

    Memoized<math::Tensor> up_;
    Memoized<math::Tensor> volume_;
};

} // namespace geometry
} // namespace pfl

#endif // PFL_GEOMETRY_CYLINDER_H
