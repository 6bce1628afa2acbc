/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_GEOMETRY_GEOMETRY_H
#define PFL_GEOMETRY_GEOMETRY_H

/**
 * @file Geometry.h
 * @brief Abstract interface for spatial domains sampled by fields
 *
 * A Geometry is an immutable, shape-bearing description of a set of
 * elements (grid cells, mesh cells, spheres, points, ...). Every query takes
 * and returns named tensors; positions carry their components along the
 * channel dimension `vector` whose item names are the spatial axes.
 *
 * Transformations return new geometries. Derived properties are computed
 * once on first access.
 */

#include "pfl/Core/Types.h"
#include "pfl/Core/Memoized.h"
#include "pfl/Math/Selection.h"
#include "pfl/Math/Tensor.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pfl {
namespace geometry {

class Geometry;
using GeometryPtr = std::shared_ptr<const Geometry>;

/// Concrete variant of a geometry
enum class GeometryType : std::uint8_t {
    UniformGrid,
    Mesh,
    Box,
    Sphere,
    Cylinder,
    Point,
    Stack
};

const char* to_string(GeometryType type);

/// Slices of an element or face tensor lying on each named boundary
using BoundarySlices = std::map<std::string, math::Selection>;

/**
 * @brief Result of a closest-surface query
 */
struct ClosestSurface {
    math::Tensor signed_distance;  ///< negative inside
    math::Tensor delta;            ///< vector from the query point to the surface point
    math::Tensor normal;           ///< outward unit normal at the surface point
};

class Geometry : public std::enable_shared_from_this<Geometry> {
public:
    virtual ~Geometry() = default;

    virtual GeometryType type() const noexcept = 0;

    /// Element centers, always with a `vector` dimension
    virtual math::Tensor center() const = 0;

    /**
     * @brief Element shape (batch, instance, spatial and dual dimensions)
     *
     * Never contains `vector`. Computed once.
     */
    const math::Shape& shape() const;

    /// Spatial axis names, the items of `center()` along `vector`
    std::vector<std::string> vector_axes() const;
    int spatial_rank() const { return static_cast<int>(vector_axes().size()); }

    /// Volume of each element (area in 2D, length in 1D)
    virtual math::Tensor volume() const = 0;

    /**
     * @brief Containment test
     *
     * Instance dimensions of the geometry are reduced with a logical OR, so
     * a set of disjoint pieces acts as their union.
     */
    virtual math::Tensor lies_inside(const math::Tensor& location) const = 0;

    /**
     * @brief Signed distance, negative inside
     *
     * Instance dimensions are reduced with a minimum.
     */
    virtual math::Tensor approximate_signed_distance(const math::Tensor& location) const = 0;

    /**
     * @brief Closest surface point for each query location
     *
     * Among several pieces, the one with the smallest signed distance wins;
     * ties go to the first.
     */
    virtual ClosestSurface approximate_closest_surface(const math::Tensor& location) const;

    /// Radius of a sphere around `center()` that encloses each element
    virtual math::Tensor bounding_radius() const = 0;
    /// Half side lengths of an axis-aligned box around `center()` enclosing each element
    virtual math::Tensor bounding_half_extent() const = 0;

    /// Copy moved so that its center is `center`
    virtual GeometryPtr at(const math::Tensor& center) const = 0;
    virtual GeometryPtr shifted(const math::Tensor& delta) const;
    /**
     * @brief Rotate about the center
     *
     * `angle` is a 2D angle, a 3D rotation vector or a rotation matrix
     * carrying `~vector`.
     */
    virtual GeometryPtr rotated(const math::Tensor& angle) const = 0;
    /// Scale about the center
    virtual GeometryPtr scaled(const math::Tensor& factor) const = 0;
    /// Select elements along batch, instance or spatial dimensions
    virtual GeometryPtr slice(const math::Selection& selection) const = 0;

    /// Uniformly distributed random points inside, with the given sample dimensions
    virtual math::Tensor sample_uniform(const math::Shape& samples) const;

    /// @name Faces
    /// Only grid-like variants define faces; the others throw NotImplemented.
    /// @{
    virtual GeometryPtr faces() const;
    virtual math::Tensor face_centers() const;
    virtual math::Tensor face_areas() const;
    virtual math::Tensor face_normals() const;
    /// Element shape with the dual dimension that enumerates faces
    virtual math::Shape face_shape() const;
    /// Slices of the elements that lie on each boundary
    virtual BoundarySlices boundary_elements() const { return {}; }
    /// Slices of the faces that lie on each boundary
    virtual BoundarySlices boundary_faces() const { return {}; }
    /// @}

    virtual bool equals(const Geometry& other) const = 0;
    virtual std::string to_string() const;

    GeometryPtr ptr() const { return shared_from_this(); }

protected:
    Geometry() = default;
    Geometry(const Geometry&) = default;

    virtual math::Shape compute_shape() const = 0;

private:
    Memoized<math::Shape> shape_;
};

inline bool operator==(const Geometry& a, const Geometry& b) { return a.equals(b); }
inline bool operator!=(const Geometry& a, const Geometry& b) { return !a.equals(b); }

/// Value equality of two geometries (both may be null)
bool same(const GeometryPtr& a, const GeometryPtr& b);

/**
 * @brief Stack geometries along a new dimension
 *
 * The variant is kept when all inputs share it (cylinders must also share
 * their axis). Otherwise a GeometryStack is returned.
 */
GeometryPtr stack(const std::vector<GeometryPtr>& geometries, const math::Dim& dim);

// ============================================================================
// Helpers shared by the variants
// ============================================================================

/**
 * @brief Add singleton spatial dimensions named after the vector axes
 *
 * Used by variants without spatial extent so that their shape still lists
 * every axis.
 */
math::Shape fill_spatial_with_singleton(const math::Shape& shape);

/// `selection` without entries for `vector`
math::Selection without_vector(const math::Selection& selection);

/// Product of the components of `v` along `vector`
math::Tensor vector_product(const math::Tensor& v);

/// Volume of a ball of `radius` in `rank` dimensions (1 to 3)
math::Tensor ball_volume(const math::Tensor& radius, int rank);

/// Instance dimension names of a shape
std::vector<std::string> instance_names(const math::Shape& shape);

/**
 * @brief Reduce per-piece closest-surface results over `dims`
 *
 * Keeps, for each query point, the entry with the smallest signed distance.
 */
ClosestSurface closest_of(const ClosestSurface& pieces, const std::vector<std::string>& dims);

} // namespace geometry
} // namespace pfl

#endif // PFL_GEOMETRY_GEOMETRY_H
