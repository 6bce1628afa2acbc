/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_GEOMETRY_UNIFORMGRID_H
#define PFL_GEOMETRY_UNIFORMGRID_H

/**
 * @file UniformGrid.h
 * @brief Regular Cartesian grid of equally sized cells
 *
 * The cells split an axis-aligned box into `resolution` cells per axis. The
 * axis order is the order of the resolution dimensions. Faces are enumerated
 * per normal axis along the dual dimension `~vector`; the face tensor of
 * axis `a` has one more entry along `a` than there are cells, so face
 * tensors are non-uniform in general.
 */

#include "pfl/Geometry/Box.h"

#include <map>
#include <utility>

namespace pfl {
namespace geometry {

class UniformGrid : public Geometry {
public:
    /**
     * @param resolution Spatial dimensions, one per axis
     * @param bounds     Domain box whose vector items equal the resolution names
     */
    UniformGrid(math::Shape resolution, BoxPtr bounds);

    /// Grid with cells of unit size and its lower corner at the origin
    explicit UniformGrid(math::Shape resolution);

    GeometryType type() const noexcept override { return GeometryType::UniformGrid; }

    const math::Shape& resolution() const noexcept { return resolution_; }
    const BoxPtr& bounds() const noexcept { return bounds_; }
    const std::vector<std::string>& axes() const noexcept { return axes_; }
    /// Cell size along `vector`
    math::Tensor dx() const;

    /// Cell centers with shape resolution & vector
    math::Tensor center() const override;
    /// Cell volume
    math::Tensor volume() const override;
    /// Domain containment
    math::Tensor lies_inside(const math::Tensor& location) const override;
    math::Tensor approximate_signed_distance(const math::Tensor& location) const override;
    ClosestSurface approximate_closest_surface(const math::Tensor& location) const override;
    math::Tensor bounding_radius() const override;
    math::Tensor bounding_half_extent() const override;

    /// Throws NotImplemented; grids move with shifted()
    GeometryPtr at(const math::Tensor& center) const override;
    /// Shift the domain; `delta` must not vary over the cells
    GeometryPtr shifted(const math::Tensor& delta) const override;
    GeometryPtr rotated(const math::Tensor& angle) const override;
    GeometryPtr scaled(const math::Tensor& factor) const override;
    /**
     * @brief Sub-grid
     *
     * An index along a spatial dimension removes it together with its axis,
     * a range keeps it with reduced bounds, and a `vector` entry keeps only
     * the listed axes.
     */
    GeometryPtr slice(const math::Selection& selection) const override;

    math::Tensor sample_uniform(const math::Shape& samples) const override;

    /// Face centers as points
    GeometryPtr faces() const override;
    math::Tensor face_centers() const override;
    math::Tensor face_areas() const override;
    math::Tensor face_normals() const override;
    math::Shape face_shape() const override;
    /// Lowest and highest face slice per axis, keyed "<axis>-" and "<axis>+"
    BoundarySlices boundary_elements() const override;
    BoundarySlices boundary_faces() const override;

    /// Grid grown by (lower, upper) cells per dimension; the cell size is unchanged
    std::shared_ptr<const UniformGrid> padded(const std::map<std::string, std::pair<Index, Index>>& widths) const;

    bool equals(const Geometry& other) const override;
    std::string to_string() const override;

protected:
    math::Shape compute_shape() const override;

private:
    /// Positions along `axis` at `offset` (0 for lower faces, 0.5 for centers)
    math::Tensor axis_positions(const std::string& axis, Index count, Real offset) const;
    math::Tensor lower(const std::string& axis) const;
    math::Tensor spacing(const std::string& axis) const;

    math::Shape resolution_;
    BoxPtr bounds_;
    std::vector<std::string> axes_;

    Memoized<math::Tensor> center_;
    Memoized<math::Tensor> face_centers_;
};

using UniformGridPtr = std::shared_ptr<const UniformGrid>;

} // namespace geometry
} // namespace pfl

#endif // PFL_GEOMETRY_UNIFORMGRID_H
