/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Geometry/Mesh.h"
#include "pfl/Geometry/UniformGrid.h"
#include "pfl/Core/Logger.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/VectorOps.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pfl {
namespace geometry {

namespace {

using Row = Eigen::Matrix<Real, 1, 2>;

Mesh::Edge edge_key(Index a, Index b) {
    return a < b ? Mesh::Edge{a, b} : Mesh::Edge{b, a};
}

Real cross(const Row& a, const Row& b) {
    return a(0) * b(1) - a(1) * b(0);
}

/// Closest point to `p` on the segment a-b
Row closest_on_segment(const Row& p, const Row& a, const Row& b) {
    Row ab = b - a;
    Real len2 = ab.squaredNorm();
    if (len2 == Real(0)) {
        return a;
    }
    Real t = std::clamp((p - a).dot(ab) / len2, Real(0), Real(1));
    return a + t * ab;
}

} // namespace

Mesh::Mesh(math::Tensor vertices, std::vector<Polygon> polygons, std::map<std::string, std::vector<Edge>> boundaries)
    : vertices_(std::move(vertices)), polygons_(std::move(polygons)), boundaries_(std::move(boundaries)) {
    PFL_CHECK_ARG(vertices_.shape().contains(dims::VERTICES) && vertices_.shape().contains(dims::VECTOR),
                  "Mesh vertices need dimensions '" + dims::VERTICES + "' and 'vector', got " +
                  vertices_.shape().to_string());
    axes_ = vertices_.shape().item_names(dims::VECTOR);
    PFL_CHECK_ARG(axes_.size() == 2, "Mesh supports two spatial axes, got " + std::to_string(axes_.size()));
    PFL_CHECK_ARG(vertices_.shape().rank() == 2, "Mesh vertices must not carry batch dimensions");
    PFL_CHECK_ARG(!polygons_.empty(), "Mesh needs at least one cell");

    const Index n_vertices = vertices_.shape().size(dims::VERTICES);
    Eigen::ArrayXd flat = vertices_.to_array({dims::VERTICES, dims::VECTOR});
    points_ = Eigen::Map<const Points>(flat.data(), n_vertices, 2);

    // Cell centroids and areas (shoelace formula)
    const Index n_cells = cell_count();
    Eigen::ArrayXd centroids(n_cells * 2);
    Eigen::ArrayXd areas(n_cells);
    for (Index c = 0; c < n_cells; ++c) {
        const Polygon& poly = polygons_[static_cast<std::size_t>(c)];
        PFL_CHECK_ARG(poly.size() >= 3, "Mesh cell " + std::to_string(c) + " has fewer than three vertices");
        Real signed_area = 0;
        Row weighted = Row::Zero();
        for (std::size_t k = 0; k < poly.size(); ++k) {
            Index a = poly[k];
            Index b = poly[(k + 1) % poly.size()];
            PFL_THROW_IF(a < 0 || a >= n_vertices || b < 0 || b >= n_vertices, OutOfRangeException,
                         "Mesh cell " + std::to_string(c) + " references a missing vertex");
            Real w = cross(points_.row(a), points_.row(b));
            signed_area += w;
            weighted += w * (points_.row(a) + points_.row(b));
        }
        signed_area *= Real(0.5);
        PFL_CHECK_ARG(signed_area != Real(0), "Mesh cell " + std::to_string(c) + " is degenerate");
        Row centroid = weighted / (Real(6) * signed_area);
        centroids[2 * c] = centroid(0);
        centroids[2 * c + 1] = centroid(1);
        areas[c] = std::abs(signed_area);
    }
    center_ = math::Tensor(math::Shape{math::instance(dims::CELLS, n_cells), math::vector_dim(axes_)}, centroids);
    volume_ = math::Tensor(math::Shape{math::instance(dims::CELLS, n_cells)}, areas);

    // Edges in order of first appearance with the cells using them
    std::vector<Edge> order;
    std::map<Edge, std::vector<Index>> users;
    for (Index c = 0; c < n_cells; ++c) {
        const Polygon& poly = polygons_[static_cast<std::size_t>(c)];
        for (std::size_t k = 0; k < poly.size(); ++k) {
            Edge key = edge_key(poly[k], poly[(k + 1) % poly.size()]);
            auto& cells = users[key];
            if (cells.empty()) {
                order.push_back(key);
            }
            cells.push_back(c);
        }
    }
    for (const auto& key : order) {
        const auto& cells = users[key];
        PFL_CHECK_ARG(cells.size() <= 2, "Mesh edge (" + std::to_string(key.first) + ", " +
                                         std::to_string(key.second) + ") is shared by more than two cells");
        if (cells.size() == 2) {
            face_vertices_.push_back(key);
            owner_.push_back(cells[0]);
            neighbor_.push_back(cells[1]);
        }
    }
    interior_faces_ = face_count();

    std::map<Edge, bool> assigned;
    for (const auto& [name, edges] : boundaries_) {
        Index start = face_count();
        for (const auto& e : edges) {
            Edge key = edge_key(e.first, e.second);
            auto it = users.find(key);
            PFL_CHECK_ARG(it != users.end() && it->second.size() == 1,
                          "Boundary '" + name + "' lists an edge that is not on the mesh boundary");
            PFL_CHECK_ARG(!assigned[key], "Boundary edge listed twice in boundary '" + name + "'");
            assigned[key] = true;
            face_vertices_.push_back(key);
            owner_.push_back(it->second.front());
            neighbor_.push_back(-1);
        }
        boundary_ranges_[name] = {start, face_count()};
    }
    for (const auto& key : order) {
        PFL_CHECK_ARG(users[key].size() == 2 || assigned[key],
                      "Mesh boundary edge (" + std::to_string(key.first) + ", " + std::to_string(key.second) +
                      ") is not part of any named boundary");
    }

    // Face geometry
    const Index n_faces = face_count();
    Eigen::ArrayXd fc(n_faces * 2);
    Eigen::ArrayXd fa(n_faces);
    Eigen::ArrayXd fn(n_faces * 2);
    for (Index f = 0; f < n_faces; ++f) {
        const Edge& e = face_vertices_[static_cast<std::size_t>(f)];
        Row a = points_.row(e.first);
        Row b = points_.row(e.second);
        Row mid = Real(0.5) * (a + b);
        Row along = b - a;
        Real length = along.norm();
        Row normal(along(1) / length, -along(0) / length);
        Index owner = owner_[static_cast<std::size_t>(f)];
        Row owner_center(centroids[2 * owner], centroids[2 * owner + 1]);
        if (normal.dot(mid - owner_center) < 0) {
            normal = -normal;
        }
        fc[2 * f] = mid(0);
        fc[2 * f + 1] = mid(1);
        fa[f] = length;
        fn[2 * f] = normal(0);
        fn[2 * f + 1] = normal(1);
    }
    const math::Dim face_dim = math::dual(dims::DUAL_FACES, n_faces);
    face_centers_ = math::Tensor(math::Shape{face_dim, math::vector_dim(axes_)}, fc);
    face_areas_ = math::Tensor(math::Shape{face_dim}, fa);
    face_normals_ = math::Tensor(math::Shape{face_dim, math::vector_dim(axes_)}, fn);

    PFL_LOG_DEBUG("Mesh with " + std::to_string(n_cells) + " cells, " + std::to_string(n_faces) + " faces (" +
                  std::to_string(interior_faces_) + " interior)");
}

std::shared_ptr<const Mesh> Mesh::from_grid(const UniformGrid& grid) {
    PFL_CHECK_ARG(grid.axes().size() == 2, "Mesh::from_grid requires a 2D grid");
    PFL_CHECK_ARG(grid.bounds()->shape().empty(), "Mesh::from_grid requires an unbatched grid");
    const auto& axes = grid.axes();
    const Index n0 = grid.resolution().size(axes[0]);
    const Index n1 = grid.resolution().size(axes[1]);
    const math::Tensor lower = grid.bounds()->lower();
    const math::Tensor step = grid.dx();
    const Real x0 = lower.value({{dims::VECTOR, 0}});
    const Real y0 = lower.value({{dims::VECTOR, 1}});
    const Real dx = step.value({{dims::VECTOR, 0}});
    const Real dy = step.value({{dims::VECTOR, 1}});

    auto vertex = [n1](Index i, Index j) { return i * (n1 + 1) + j; };

    Eigen::ArrayXd positions((n0 + 1) * (n1 + 1) * 2);
    for (Index i = 0; i <= n0; ++i) {
        for (Index j = 0; j <= n1; ++j) {
            positions[2 * vertex(i, j)] = x0 + static_cast<Real>(i) * dx;
            positions[2 * vertex(i, j) + 1] = y0 + static_cast<Real>(j) * dy;
        }
    }
    std::vector<Polygon> polygons;
    for (Index i = 0; i < n0; ++i) {
        for (Index j = 0; j < n1; ++j) {
            polygons.push_back({vertex(i, j), vertex(i + 1, j), vertex(i + 1, j + 1), vertex(i, j + 1)});
        }
    }
    std::map<std::string, std::vector<Edge>> boundaries;
    for (Index j = 0; j < n1; ++j) {
        boundaries[axes[0] + "-"].emplace_back(vertex(0, j), vertex(0, j + 1));
        boundaries[axes[0] + "+"].emplace_back(vertex(n0, j), vertex(n0, j + 1));
    }
    for (Index i = 0; i < n0; ++i) {
        boundaries[axes[1] + "-"].emplace_back(vertex(i, 0), vertex(i + 1, 0));
        boundaries[axes[1] + "+"].emplace_back(vertex(i, n1), vertex(i + 1, n1));
    }
    math::Tensor vertices(math::Shape{math::instance(dims::VERTICES, (n0 + 1) * (n1 + 1)), math::vector_dim(axes)},
                          positions);
    return std::make_shared<const Mesh>(vertices, std::move(polygons), std::move(boundaries));
}

math::Shape Mesh::compute_shape() const {
    return math::Shape{math::instance(dims::CELLS, cell_count())};
}

Mesh::Points Mesh::query_points(const math::Tensor& location, math::Shape& point_shape) const {
    PFL_CHECK_SHAPE(location.shape().contains(dims::VECTOR), "Mesh queries need locations with a 'vector' dimension");
    math::Tensor ordered = location.slice(math::Selection{{dims::VECTOR, axes_}});
    point_shape = ordered.shape().without(dims::VECTOR);
    std::vector<std::string> order = point_shape.names();
    order.push_back(dims::VECTOR);
    Eigen::ArrayXd flat = ordered.to_array(order);
    return Eigen::Map<const Points>(flat.data(), flat.size() / 2, 2);
}

bool Mesh::polygon_contains(Index cell, const Row& p) const {
    const Polygon& poly = polygons_[static_cast<std::size_t>(cell)];
    bool inside = false;
    for (std::size_t k = 0, prev = poly.size() - 1; k < poly.size(); prev = k++) {
        Row a = points_.row(poly[k]);
        Row b = points_.row(poly[prev]);
        if ((a(1) > p(1)) != (b(1) > p(1))) {
            Real x = a(0) + (p(1) - a(1)) * (b(0) - a(0)) / (b(1) - a(1));
            if (p(0) < x) {
                inside = !inside;
            }
        }
    }
    return inside;
}

math::Tensor Mesh::cell_index(const math::Tensor& location) const {
    math::Shape point_shape;
    Points p = query_points(location, point_shape);
    Eigen::ArrayXd result = Eigen::ArrayXd::Constant(p.rows(), Real(-1));
    for (Index i = 0; i < p.rows(); ++i) {
        for (Index c = 0; c < cell_count(); ++c) {
            if (polygon_contains(c, p.row(i))) {
                result[i] = static_cast<Real>(c);
                break;
            }
        }
    }
    return math::Tensor(point_shape, result);
}

math::Tensor Mesh::nearest_cell(const math::Tensor& location) const {
    math::Shape point_shape;
    Points p = query_points(location, point_shape);
    Eigen::ArrayXd centroids = center_.to_array({dims::CELLS, dims::VECTOR});
    Eigen::Map<const Points> c(centroids.data(), cell_count(), 2);
    Eigen::ArrayXd result(p.rows());
    for (Index i = 0; i < p.rows(); ++i) {
        Eigen::Index best = 0;
        (c.rowwise() - p.row(i)).rowwise().squaredNorm().minCoeff(&best);
        result[i] = static_cast<Real>(best);
    }
    return math::Tensor(point_shape, result);
}

math::Tensor Mesh::lies_inside(const math::Tensor& location) const {
    return math::binary(cell_index(location), Real(0), math::BinaryOp::GreaterEqual);
}

math::Tensor Mesh::approximate_signed_distance(const math::Tensor& location) const {
    return approximate_closest_surface(location).signed_distance;
}

ClosestSurface Mesh::approximate_closest_surface(const math::Tensor& location) const {
    math::Shape point_shape;
    Points p = query_points(location, point_shape);
    Eigen::ArrayXd inside = lies_inside(location).to_array(point_shape.names());
    Eigen::ArrayXd normals = face_normals_.to_array({dims::DUAL_FACES, dims::VECTOR});

    Eigen::ArrayXd distance(p.rows());
    Eigen::ArrayXd delta(p.rows() * 2);
    Eigen::ArrayXd normal(p.rows() * 2);
    for (Index i = 0; i < p.rows(); ++i) {
        Real best = std::numeric_limits<Real>::infinity();
        Row best_point = p.row(i);
        Index best_face = interior_faces_;
        for (Index f = interior_faces_; f < face_count(); ++f) {
            const Edge& e = face_vertices_[static_cast<std::size_t>(f)];
            Row q = closest_on_segment(p.row(i), points_.row(e.first), points_.row(e.second));
            Real d = (q - p.row(i)).norm();
            if (d < best) {
                best = d;
                best_point = q;
                best_face = f;
            }
        }
        distance[i] = inside[i] != Real(0) ? -best : best;
        delta[2 * i] = best_point(0) - p(i, 0);
        delta[2 * i + 1] = best_point(1) - p(i, 1);
        normal[2 * i] = best_face < face_count() ? normals[2 * best_face] : Real(0);
        normal[2 * i + 1] = best_face < face_count() ? normals[2 * best_face + 1] : Real(0);
    }
    math::Shape vector_shape = point_shape & math::Shape{math::vector_dim(axes_)};
    ClosestSurface result;
    result.signed_distance = math::Tensor(point_shape, distance);
    result.delta = math::Tensor(vector_shape, delta);
    result.normal = math::Tensor(vector_shape, normal);
    return result;
}

math::Tensor Mesh::bounding_radius() const {
    Eigen::ArrayXd radius(cell_count());
    for (Index c = 0; c < cell_count(); ++c) {
        Row centroid(center_.value({{dims::CELLS, c}, {dims::VECTOR, 0}}),
                     center_.value({{dims::CELLS, c}, {dims::VECTOR, 1}}));
        Real r = 0;
        for (Index v : polygons_[static_cast<std::size_t>(c)]) {
            r = std::max(r, (points_.row(v) - centroid).norm());
        }
        radius[c] = r;
    }
    return math::Tensor(shape(), radius);
}

math::Tensor Mesh::bounding_half_extent() const {
    Eigen::ArrayXd extent(cell_count() * 2);
    for (Index c = 0; c < cell_count(); ++c) {
        Row centroid(center_.value({{dims::CELLS, c}, {dims::VECTOR, 0}}),
                     center_.value({{dims::CELLS, c}, {dims::VECTOR, 1}}));
        Row e = Row::Zero();
        for (Index v : polygons_[static_cast<std::size_t>(c)]) {
            e = e.cwiseMax((points_.row(v) - centroid).cwiseAbs());
        }
        extent[2 * c] = e(0);
        extent[2 * c + 1] = e(1);
    }
    return math::Tensor(shape() & math::Shape{math::vector_dim(axes_)}, extent);
}

std::shared_ptr<const Mesh> Mesh::with_points(const Points& points) const {
    Eigen::ArrayXd flat(points.size());
    Eigen::Map<Points>(flat.data(), points.rows(), 2) = points;
    math::Tensor vertices(vertices_.shape(), flat);
    return std::make_shared<const Mesh>(vertices, polygons_, boundaries_);
}

GeometryPtr Mesh::at(const math::Tensor&) const {
    PFL_NOT_IMPLEMENTED("Mesh::at; use shifted() to move a mesh");
}

GeometryPtr Mesh::shifted(const math::Tensor& delta) const {
    PFL_CHECK_SHAPE(delta.shape().without(dims::VECTOR).empty(),
                    "Mesh can only be shifted uniformly, got delta " + delta.shape().to_string());
    math::Tensor d = delta.expand(math::Shape{math::vector_dim(axes_)}).slice(math::Selection{{dims::VECTOR, axes_}});
    Row offset(d.value({{dims::VECTOR, 0}}), d.value({{dims::VECTOR, 1}}));
    Points moved = points_.rowwise() + offset;
    return with_points(moved);
}

GeometryPtr Mesh::rotated(const math::Tensor& angle) const {
    math::Tensor matrix = math::rotation_matrix(angle, axes_);
    PFL_CHECK_SHAPE(matrix.shape().rank() == 2, "Mesh rotations must not be batched");
    Eigen::Matrix<Real, 2, 2> r;
    for (Index i = 0; i < 2; ++i) {
        for (Index j = 0; j < 2; ++j) {
            r(i, j) = matrix.value({{dims::VECTOR, i}, {dims::DUAL_VECTOR, j}});
        }
    }
    Eigen::ArrayXd centroids = center_.to_array({dims::CELLS, dims::VECTOR});
    Row pivot = Eigen::Map<const Points>(centroids.data(), cell_count(), 2).colwise().mean();
    Points moved = ((points_.rowwise() - pivot) * r.transpose()).rowwise() + pivot;
    return with_points(moved);
}

GeometryPtr Mesh::scaled(const math::Tensor& factor) const {
    PFL_CHECK_SHAPE(factor.shape().empty(), "Mesh scaling takes a scalar factor");
    Eigen::ArrayXd centroids = center_.to_array({dims::CELLS, dims::VECTOR});
    Row pivot = Eigen::Map<const Points>(centroids.data(), cell_count(), 2).colwise().mean();
    Points moved = ((points_.rowwise() - pivot) * factor.item()).rowwise() + pivot;
    return with_points(moved);
}

GeometryPtr Mesh::slice(const math::Selection& selection) const {
    for (const auto& name : {dims::CELLS, dims::DUAL_FACES, dims::VERTICES}) {
        if (selection.count(name)) {
            PFL_NOT_IMPLEMENTED("selecting '" + name + "' of a Mesh");
        }
    }
    return ptr();
}

math::Shape Mesh::face_shape() const {
    return shape() & math::Shape{math::dual(dims::DUAL_FACES, face_count())};
}

BoundarySlices Mesh::boundary_faces() const {
    BoundarySlices slices;
    for (const auto& [name, range] : boundary_ranges_) {
        slices[name] = math::Selection{{dims::DUAL_FACES, math::range(range.first, range.second)}};
    }
    return slices;
}

bool Mesh::equals(const Geometry& other) const {
    if (other.type() != GeometryType::Mesh) {
        return false;
    }
    const auto& mesh = static_cast<const Mesh&>(other);
    return polygons_ == mesh.polygons_ && boundaries_ == mesh.boundaries_ &&
           math::close(vertices_, mesh.vertices_);
}

std::string Mesh::to_string() const {
    return "Mesh(" + std::to_string(cell_count()) + " cells, " + std::to_string(face_count()) + " faces)";
}

} // namespace geometry
} // namespace pfl
