/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_GEOMETRY_GEOMETRYSTACK_H
#define PFL_GEOMETRY_GEOMETRYSTACK_H

/**
 * @file GeometryStack.h
 * @brief Stack of geometries of possibly different variants
 *
 * Queries are answered by every member and stacked along the stack
 * dimension. If that dimension is an instance dimension, the members form a
 * union: containment is OR-reduced and distances are min-reduced over it.
 */

#include "pfl/Geometry/Geometry.h"

namespace pfl {
namespace geometry {

class GeometryStack : public Geometry {
public:
    GeometryStack(std::vector<GeometryPtr> geometries, math::Dim dim);

    GeometryType type() const noexcept override { return GeometryType::Stack; }

    const std::vector<GeometryPtr>& geometries() const noexcept { return geometries_; }
    const math::Dim& stack_dim() const noexcept { return dim_; }

    math::Tensor center() const override;
    math::Tensor volume() const override;
    math::Tensor lies_inside(const math::Tensor& location) const override;
    math::Tensor approximate_signed_distance(const math::Tensor& location) const override;
    ClosestSurface approximate_closest_surface(const math::Tensor& location) const override;
    math::Tensor bounding_radius() const override;
    math::Tensor bounding_half_extent() const override;

    GeometryPtr at(const math::Tensor& center) const override;
    GeometryPtr shifted(const math::Tensor& delta) const override;
    GeometryPtr rotated(const math::Tensor& angle) const override;
    GeometryPtr scaled(const math::Tensor& factor) const override;
    GeometryPtr slice(const math::Selection& selection) const override;

    bool equals(const Geometry& other) const override;
    std::string to_string() const override;

protected:
    math::Shape compute_shape() const override;

private:
    bool is_union() const noexcept { return dim_.kind == DimKind::Instance; }
    /// Stack one tensor per member
    template<typename PerMember>
    math::Tensor collect(PerMember&& per_member) const;
    /// Apply a transformation to every member, slicing `arg` along the stack dimension
    template<typename Transform>
    GeometryPtr transform_each(const math::Tensor& arg, Transform&& transform) const;

    std::vector<GeometryPtr> geometries_;
    math::Dim dim_;
};

} // namespace geometry
} // namespace pfl

#endif // PFL_GEOMETRY_GEOMETRYSTACK_H
