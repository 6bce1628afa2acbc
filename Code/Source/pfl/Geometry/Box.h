/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_GEOMETRY_BOX_H
#define PFL_GEOMETRY_BOX_H

/**
 * @file Box.h
 * @brief Box given by its lower and upper corners, optionally rotated about its center
 */

#include "pfl/Geometry/Geometry.h"

#include <optional>

namespace pfl {
namespace geometry {

class Box : public Geometry {
public:
    /**
     * @param lower    Lower corner, carrying `vector`
     * @param upper    Upper corner with the same axis names
     * @param rotation Rotation about the center as angle, rotation vector or matrix; none for axis-aligned
     *
     * The corners are given in the unrotated frame.
     */
    Box(math::Tensor lower, math::Tensor upper, std::optional<math::Tensor> rotation = std::nullopt);

    /// Box of the given size with its lower corner at the origin
    static std::shared_ptr<const Box> from_size(const std::vector<std::string>& axes,
                                                const std::vector<Real>& size);
    /// Box from center and half side lengths
    static std::shared_ptr<const Box> cuboid(const math::Tensor& center, const math::Tensor& half_size,
                                             std::optional<math::Tensor> rotation = std::nullopt);

    GeometryType type() const noexcept override { return GeometryType::Box; }

    const math::Tensor& lower() const noexcept { return lower_; }
    const math::Tensor& upper() const noexcept { return upper_; }
    /// Rotation matrix, if rotated
    const std::optional<math::Tensor>& rotation() const noexcept { return rotation_; }
    bool is_axis_aligned() const noexcept { return !rotation_.has_value(); }
    math::Tensor size() const { return upper_ - lower_; }
    math::Tensor half_size() const { return size() * Real(0.5); }

    math::Tensor center() const override { return (lower_ + upper_) * Real(0.5); }
    math::Tensor volume() const override;
    math::Tensor lies_inside(const math::Tensor& location) const override;
    math::Tensor approximate_signed_distance(const math::Tensor& location) const override;
    ClosestSurface approximate_closest_surface(const math::Tensor& location) const override;
    math::Tensor bounding_radius() const override;
    math::Tensor bounding_half_extent() const override;

    GeometryPtr at(const math::Tensor& center) const override;
    GeometryPtr shifted(const math::Tensor& delta) const override;
    /// Rotates about the center, composing with an existing rotation
    GeometryPtr rotated(const math::Tensor& angle) const override;
    GeometryPtr scaled(const math::Tensor& factor) const override;
    /// Axes of a rotated box cannot be selected
    GeometryPtr slice(const math::Selection& selection) const override;

    math::Tensor sample_uniform(const math::Shape& samples) const override;

    /// Map a global position to box coordinates, 0 at the lower and 1 at the upper corner
    math::Tensor global_to_local(const math::Tensor& global) const;
    math::Tensor local_to_global(const math::Tensor& local) const;

    bool equals(const Geometry& other) const override;
    std::string to_string() const override;

protected:
    math::Shape compute_shape() const override;

private:
    /// Location in the unrotated frame of the box
    math::Tensor unrotate(const math::Tensor& location) const;

    math::Tensor lower_;
    math::Tensor upper_;
    std::optional<math::Tensor> rotation_;
};

using BoxPtr = std::shared_ptr<const Box>;

} // namespace geometry
} // namespace pfl

#endif // PFL_GEOMETRY_BOX_H
