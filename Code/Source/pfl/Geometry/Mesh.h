/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_GEOMETRY_MESH_H
#define PFL_GEOMETRY_MESH_H

/**
 * @file Mesh.h
 * @brief Unstructured 2D mesh of polygonal cells
 *
 * Cells are enumerated along the instance dimension `cells`. Faces (edges)
 * are enumerated along the dual dimension `~faces`: interior faces first,
 * then the faces of each named boundary in boundary-name order, so every
 * boundary occupies one contiguous range of the face tensor.
 */

#include "pfl/Geometry/Geometry.h"

#include <Eigen/Core>
#include <map>
#include <utility>
#include <vector>

namespace pfl {
namespace geometry {

class UniformGrid;

class Mesh : public Geometry {
public:
    using Polygon = std::vector<Index>;
    using Edge = std::pair<Index, Index>;

    /**
     * @param vertices   Positions with an instance dimension `vertices` and a 2-axis `vector`
     * @param polygons   Vertex indices of each cell, in order around the cell
     * @param boundaries Boundary edges by name; every edge used by only one cell must be listed
     */
    Mesh(math::Tensor vertices, std::vector<Polygon> polygons, std::map<std::string, std::vector<Edge>> boundaries);

    /// Quadrilateral mesh covering a 2D grid, with boundaries "<axis>-" and "<axis>+"
    static std::shared_ptr<const Mesh> from_grid(const UniformGrid& grid);

    GeometryType type() const noexcept override { return GeometryType::Mesh; }

    const math::Tensor& vertices() const noexcept { return vertices_; }
    const std::vector<Polygon>& polygons() const noexcept { return polygons_; }
    const std::map<std::string, std::vector<Edge>>& boundaries() const noexcept { return boundaries_; }
    Index cell_count() const noexcept { return static_cast<Index>(polygons_.size()); }
    Index face_count() const noexcept { return static_cast<Index>(face_vertices_.size()); }
    Index interior_face_count() const noexcept { return interior_faces_; }

    /// Cell on the inner side of each face
    const std::vector<Index>& face_owner() const noexcept { return owner_; }
    /// Cell on the outer side of each face, -1 for boundary faces
    const std::vector<Index>& face_neighbor() const noexcept { return neighbor_; }

    /// Cell centroids along `cells`
    math::Tensor center() const override { return center_; }
    /// Cell areas
    math::Tensor volume() const override { return volume_; }
    math::Tensor lies_inside(const math::Tensor& location) const override;
    /// Distance to the nearest boundary edge, negative inside the mesh
    math::Tensor approximate_signed_distance(const math::Tensor& location) const override;
    ClosestSurface approximate_closest_surface(const math::Tensor& location) const override;
    math::Tensor bounding_radius() const override;
    math::Tensor bounding_half_extent() const override;

    /**
     * @brief Index of the cell containing each location, -1 outside
     *
     * The result has the shape of `location` without `vector`.
     */
    math::Tensor cell_index(const math::Tensor& location) const;
    /// Index of the cell with the nearest centroid
    math::Tensor nearest_cell(const math::Tensor& location) const;

    /// Throws NotImplemented; meshes move with shifted()
    GeometryPtr at(const math::Tensor& center) const override;
    GeometryPtr shifted(const math::Tensor& delta) const override;
    /// Rotate the vertices about the mean cell centroid
    GeometryPtr rotated(const math::Tensor& angle) const override;
    GeometryPtr scaled(const math::Tensor& factor) const override;
    /// Cells and faces cannot be selected; other entries are ignored
    GeometryPtr slice(const math::Selection& selection) const override;

    math::Tensor face_centers() const override { return face_centers_; }
    /// Edge lengths
    math::Tensor face_areas() const override { return face_areas_; }
    /// Unit normals pointing from the owner cell outward
    math::Tensor face_normals() const override { return face_normals_; }
    math::Shape face_shape() const override;
    /// Contiguous `~faces` range of each named boundary; boundary cells are the owners of these faces
    BoundarySlices boundary_faces() const override;

    bool equals(const Geometry& other) const override;
    std::string to_string() const override;

protected:
    math::Shape compute_shape() const override;

private:
    using Points = Eigen::Matrix<Real, Eigen::Dynamic, 2, Eigen::RowMajor>;

    /// Query locations flattened to rows, and the shape they came from
    Points query_points(const math::Tensor& location, math::Shape& point_shape) const;
    bool polygon_contains(Index cell, const Eigen::Matrix<Real, 1, 2>& p) const;
    std::shared_ptr<const Mesh> with_points(const Points& points) const;

    math::Tensor vertices_;
    std::vector<Polygon> polygons_;
    std::map<std::string, std::vector<Edge>> boundaries_;
    std::vector<std::string> axes_;
    Points points_;

    std::vector<Edge> face_vertices_;
    std::vector<Index> owner_;
    std::vector<Index> neighbor_;
    Index interior_faces_ = 0;
    std::map<std::string, std::pair<Index, Index>> boundary_ranges_;

    math::Tensor center_;
    math::Tensor volume_;
    math::Tensor face_centers_;
    math::Tensor face_areas_;
    math::Tensor face_normals_;
};

using MeshPtr = std::shared_ptr<const Mesh>;

} // namespace geometry
} // namespace pfl

#endif // PFL_GEOMETRY_MESH_H
