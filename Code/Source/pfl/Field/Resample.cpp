/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Field/Resample.h"
#include "pfl/Core/Logger.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Extrapolation/ConstantExtrapolation.h"
#include "pfl/Extrapolation/Constants.h"
#include "pfl/Extrapolation/CopyExtrapolation.h"
#include "pfl/Geometry/Mesh.h"
#include "pfl/Geometry/UniformGrid.h"
#include "pfl/Math/VectorOps.h"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>
#include <functional>

namespace pfl {
namespace field {

using geometry::GeometryType;
using geometry::Mesh;
using geometry::UniformGrid;
using math::Dim;
using math::Selection;
using math::Shape;
using math::Tensor;

namespace {

using PointSampler = std::function<Tensor(const Tensor&)>;

std::vector<Index> row_major_strides(const std::vector<Index>& sizes) {
    std::vector<Index> strides(sizes.size(), 1);
    for (std::size_t i = sizes.size(); i-- > 1;) {
        strides[i - 1] = strides[i] * sizes[i];
    }
    return strides;
}

/// Tensor of `shape` from row-major `data` whose dimensions are laid out in `order`
Tensor from_layout(const Shape& shape, const std::vector<std::string>& order, const Eigen::ArrayXd& data) {
    std::vector<Index> sizes;
    for (const auto& name : order) {
        sizes.push_back(shape.size(name));
    }
    const std::vector<Index> layout = row_major_strides(sizes);
    std::vector<Index> stride(shape.rank(), 0);
    for (std::size_t i = 0; i < order.size(); ++i) {
        stride[static_cast<std::size_t>(shape.index_of(order[i]))] = layout[i];
    }
    const std::vector<Index> extent = shape.sizes();
    Eigen::ArrayXd out(shape.volume());
    std::vector<Index> index(extent.size(), 0);
    for (Index k = 0; k < out.size(); ++k) {
        Index position = 0;
        for (std::size_t j = 0; j < index.size(); ++j) {
            position += index[j] * stride[j];
        }
        out[k] = data[position];
        for (std::size_t j = index.size(); j-- > 0;) {
            if (++index[j] < extent[j]) {
                break;
            }
            index[j] = 0;
        }
    }
    return Tensor(shape, std::move(out));
}

/**
 * @brief Flat access to `values` by position along `axes`
 *
 * Results have the dimensions of the query and the remaining dimensions of
 * the values. value(k, offset) reads the entry belonging to result element
 * k at the flat offset along the axes.
 */
class AxisLookup {
public:
    AxisLookup(const Tensor& values, const std::vector<std::string>& axes, const Shape& query) {
        for (const auto& a : axes) {
            PFL_CHECK_SHAPE(values.shape().contains(a),
                            "Values " + values.shape().to_string() + " lack dimension '" + a + "'");
            extent_.push_back(values.shape().size(a));
        }
        const Shape others = values.shape().without(axes);
        out_ = query & others;
        std::vector<std::string> order = others.names();
        order.insert(order.end(), axes.begin(), axes.end());
        data_ = values.to_array(order);
        stride_ = row_major_strides(extent_);
        const Index block = extent_.empty() ? 1 : extent_.front() * stride_.front();

        const Index m = others.volume();
        Tensor ids = others.empty() ? Tensor(Real(0))
                                    : Tensor(others, Eigen::ArrayXd::LinSpaced(m, 0, static_cast<Real>(m - 1)));
        Eigen::ArrayXd flat_ids = flatten(ids);
        base_.resize(static_cast<std::size_t>(flat_ids.size()));
        for (Index k = 0; k < flat_ids.size(); ++k) {
            base_[static_cast<std::size_t>(k)] = static_cast<Index>(std::lround(flat_ids[k])) * block;
        }
    }

    Index size() const { return out_.volume(); }
    Index extent(std::size_t axis) const { return extent_[axis]; }
    Index stride(std::size_t axis) const { return stride_[axis]; }
    Real value(Index k, Index offset) const { return data_[base_[static_cast<std::size_t>(k)] + offset]; }

    Eigen::ArrayXd flatten(const Tensor& t) const { return t.expand(out_).to_array(out_.names()); }
    Tensor result(Eigen::ArrayXd data) const { return Tensor(out_, std::move(data)); }

private:
    Shape out_;
    Eigen::ArrayXd data_;
    std::vector<Index> extent_;
    std::vector<Index> stride_;
    std::vector<Index> base_;
};

struct GridAxis {
    std::string name;
    Real origin;   ///< position of sample 0
    Real spacing;
    Index period;  ///< samples per period, 0 if not periodic
};

bool is_periodic(const extrapolation::Extrapolation& rule, const std::string& axis) {
    using extrapolation::PeriodicExtrapolation;
    return dynamic_cast<const PeriodicExtrapolation*>(rule.on_side(axis, false).get()) != nullptr &&
           dynamic_cast<const PeriodicExtrapolation*>(rule.on_side(axis, true).get()) != nullptr;
}

Real axis_value(const Tensor& v, const std::string& axis) {
    return v.slice(Selection{{dims::VECTOR, axis}}).item();
}

/// Sample layout of a grid; `face_axis` selects the faces normal to that axis
std::vector<GridAxis> grid_axes(const UniformGrid& grid, const std::string& face_axis,
                                const extrapolation::Extrapolation& rule) {
    std::vector<GridAxis> axes;
    const Tensor lower = grid.bounds()->lower();
    const Tensor dx = grid.dx();
    for (const auto& a : grid.axes()) {
        const Real h = axis_value(dx, a);
        const bool face = a == face_axis;
        const Index n = grid.resolution().size(a);
        axes.push_back(GridAxis{a, axis_value(lower, a) + (face ? Real(0) : Real(0.5) * h), h,
                                is_periodic(rule, a) ? n : 0});
    }
    return axes;
}

/**
 * @brief Multilinear interpolation of `values` sampled along `axes` at `points`
 *
 * Neighbours beyond the samples come from `rule`; positions further out are
 * clamped, or wrapped along periodic axes.
 */
Tensor interpolate_grid(const Tensor& values, const std::vector<GridAxis>& axes,
                        const extrapolation::Extrapolation& rule, const Tensor& points) {
    std::vector<std::string> names;
    extrapolation::PadWidths widths;
    extrapolation::PadCoordinates coords;
    for (const auto& a : axes) {
        PFL_CHECK_SHAPE(values.shape().contains(a.name),
                        "Grid values " + values.shape().to_string() + " lack axis '" + a.name + "'");
        names.push_back(a.name);
        widths[a.name] = {1, 1};
        coords.axes[a.name] = {a.origin, a.spacing};
    }
    const Tensor padded = rule.pad(values, widths, &coords);
    const AxisLookup lookup(padded, names, points.shape().without(dims::VECTOR));

    const std::size_t d = axes.size();
    std::vector<Eigen::ArrayXd> coordinate(d);
    for (std::size_t i = 0; i < d; ++i) {
        coordinate[i] = lookup.flatten(points.slice(Selection{{dims::VECTOR, axes[i].name}}));
    }

    std::vector<Index> lower(d);
    std::vector<Real> fraction(d);
    Eigen::ArrayXd out(lookup.size());
    for (Index k = 0; k < out.size(); ++k) {
        for (std::size_t i = 0; i < d; ++i) {
            const Index n = lookup.extent(i) - 2;
            Real u = (coordinate[i][k] - axes[i].origin) / axes[i].spacing;
            if (axes[i].period > 0) {
                const Real period = static_cast<Real>(axes[i].period);
                u = std::fmod(u, period);
                if (u < 0) {
                    u += period;
                }
            }
            // Index into the padded samples
            const Real p = std::clamp<Real>(u + 1, 0, static_cast<Real>(n + 1));
            lower[i] = std::min<Index>(static_cast<Index>(std::floor(p)), n);
            fraction[i] = p - static_cast<Real>(lower[i]);
        }
        Real sum = 0;
        for (Index corner = 0; corner < (Index(1) << d); ++corner) {
            Real weight = 1;
            Index offset = 0;
            for (std::size_t i = 0; i < d; ++i) {
                const bool up = (corner >> i) & 1;
                weight *= up ? fraction[i] : 1 - fraction[i];
                offset += (lower[i] + (up ? 1 : 0)) * lookup.stride(i);
            }
            if (weight != 0) {
                sum += weight * lookup.value(k, offset);
            }
        }
        out[k] = sum;
    }
    return lookup.result(std::move(out));
}

Tensor sample_grid(const Field& source, const UniformGrid& grid, const Tensor& points) {
    const auto& rule = *source.boundary();
    if (source.is_centered()) {
        return interpolate_grid(source.values(), grid_axes(grid, "", rule), rule, points);
    }
    std::vector<Tensor> components;
    for (const auto& a : grid.axes()) {
        ExtrapolationPtr component_rule = rule.component(a);
        // Periodic faces repeat every n cells, like centers
        components.push_back(interpolate_grid(source.face_component(a), grid_axes(grid, a, *component_rule),
                                              *component_rule, points));
    }
    return Tensor::stack(components, math::vector_dim(grid.axes()));
}

/// `values[cells]` along the `cells` dimension
Tensor gather_cells(const Tensor& values, const Tensor& cells) {
    const AxisLookup lookup(values, {dims::CELLS}, cells.shape());
    const Eigen::ArrayXd index = lookup.flatten(cells);
    Eigen::ArrayXd out(lookup.size());
    for (Index k = 0; k < out.size(); ++k) {
        out[k] = lookup.value(k, static_cast<Index>(index[k]));
    }
    return lookup.result(std::move(out));
}

/// Cell values of a mesh field; staggered values are averaged over the faces of each cell
Tensor mesh_cell_values(const Field& source, const Mesh& mesh) {
    if (source.is_centered()) {
        return source.values();
    }
    const Tensor faces = source.with_boundary(extrapolation::ZERO_GRADIENT).values();
    const Shape others = faces.shape().without(dims::DUAL_FACES);
    std::vector<std::string> order = others.names();
    order.push_back(dims::DUAL_FACES);
    const Eigen::ArrayXd data = faces.to_array(order);

    const Index m = others.volume();
    const Index face_count = mesh.face_count();
    const Index cell_count = mesh.cell_count();
    Eigen::ArrayXd sum = Eigen::ArrayXd::Zero(m * cell_count);
    Eigen::ArrayXd count = Eigen::ArrayXd::Zero(cell_count);
    for (Index f = 0; f < face_count; ++f) {
        const Index owner = mesh.face_owner()[static_cast<std::size_t>(f)];
        const Index neighbor = mesh.face_neighbor()[static_cast<std::size_t>(f)];
        count[owner] += 1;
        if (neighbor >= 0) {
            count[neighbor] += 1;
        }
        for (Index j = 0; j < m; ++j) {
            sum[j * cell_count + owner] += data[j * face_count + f];
            if (neighbor >= 0) {
                sum[j * cell_count + neighbor] += data[j * face_count + f];
            }
        }
    }
    for (Index j = 0; j < m; ++j) {
        for (Index c = 0; c < cell_count; ++c) {
            sum[j * cell_count + c] /= std::max<Real>(count[c], 1);
        }
    }
    std::vector<std::string> out_order = others.names();
    out_order.push_back(dims::CELLS);
    return from_layout(others & Shape{math::instance(dims::CELLS, cell_count)}, out_order, sum);
}

/// Face values of a mesh field: mean of the adjacent cells, the owner on the boundary
Tensor mesh_face_values(const Field& source, const Mesh& mesh, const extrapolation::Extrapolation& rule) {
    const Tensor cells = mesh_cell_values(source, mesh);
    const Index face_count = mesh.face_count();
    std::vector<Real> owner;
    std::vector<Real> other;
    for (Index f = 0; f < face_count; ++f) {
        const Index o = mesh.face_owner()[static_cast<std::size_t>(f)];
        const Index n = mesh.face_neighbor()[static_cast<std::size_t>(f)];
        owner.push_back(static_cast<Real>(o));
        other.push_back(static_cast<Real>(n >= 0 ? n : o));
    }
    const Shape faces{math::dual(dims::DUAL_FACES, face_count)};
    const Tensor mean = (gather_cells(cells, Tensor::from_values(faces, owner)) +
                         gather_cells(cells, Tensor::from_values(faces, other))) * Real(0.5);
    return math::slice_off(mean, determined_faces(mesh, rule));
}

/// Piecewise-constant mesh values; points outside take the nearest cell or the constant rule
Tensor sample_mesh(const Field& source, const Mesh& mesh, const Tensor& points) {
    const Tensor cells = mesh_cell_values(source, mesh);
    const Tensor index = mesh.cell_index(points);
    const Tensor inside = math::binary(index, Tensor(Real(0)), math::BinaryOp::GreaterEqual);
    Tensor values = gather_cells(cells, math::where(inside, index, mesh.nearest_cell(points)));
    if (auto constant = dynamic_cast<const extrapolation::ConstantExtrapolation*>(source.boundary().get())) {
        values = math::where(inside, values, Tensor(constant->value()));
    }
    return values;
}

/// Point values summed or averaged into the grid cells containing them; empty cells hold 0
Tensor scatter(const Field& source, const UniformGrid& grid, ScatterReduce reduce) {
    const Tensor positions = source.center();
    const Shape point_shape = positions.shape().without(dims::VECTOR);
    const Tensor values = source.values();
    const Shape others = values.shape().without(point_shape.names());
    std::vector<std::string> order = point_shape.names();
    for (const auto& name : others.names()) {
        order.push_back(name);
    }
    const Eigen::ArrayXd point_values = values.expand(point_shape).to_array(order);

    const auto& axes = grid.axes();
    const Tensor lower = grid.bounds()->lower();
    const Tensor dx = grid.dx();
    std::vector<Eigen::ArrayXd> coordinate;
    for (const auto& a : axes) {
        coordinate.push_back(positions.slice(Selection{{dims::VECTOR, a}}).expand(point_shape).to_array(point_shape.names()));
    }

    const Index point_count = point_shape.volume();
    const Index m = others.volume();
    const Index cell_count = grid.resolution().volume();
    Eigen::ArrayXd sum = Eigen::ArrayXd::Zero(cell_count * m);
    Eigen::ArrayXd count = Eigen::ArrayXd::Zero(cell_count);
    for (Index p = 0; p < point_count; ++p) {
        Index cell = 0;
        bool inside = true;
        for (std::size_t i = 0; i < axes.size(); ++i) {
            const Index n = grid.resolution().size(axes[i]);
            const auto c = static_cast<Index>(std::floor((coordinate[i][p] - axis_value(lower, axes[i])) /
                                                         axis_value(dx, axes[i])));
            inside = inside && c >= 0 && c < n;
            cell = cell * n + c;
        }
        if (!inside) {
            continue;
        }
        count[cell] += 1;
        for (Index j = 0; j < m; ++j) {
            sum[cell * m + j] += point_values[p * m + j];
        }
    }
    if (reduce == ScatterReduce::Mean) {
        for (Index cell = 0; cell < cell_count; ++cell) {
            if (count[cell] > 0) {
                for (Index j = 0; j < m; ++j) {
                    sum[cell * m + j] /= count[cell];
                }
            }
        }
    }
    std::vector<std::string> out_order = axes;
    for (const auto& name : others.names()) {
        out_order.push_back(name);
    }
    return from_layout(grid.resolution() & others, out_order, sum);
}

Tensor project_on_normals(const Tensor& values, const geometry::Geometry& geometry,
                          const extrapolation::Extrapolation& rule) {
    if (!values.shape().contains(dims::VECTOR)) {
        return values;
    }
    return math::dot(values, math::slice_off(geometry.face_normals(), determined_faces(geometry, rule)));
}

/// Evaluate `at_points` at the sample points; grid faces keep the component normal to each face
Tensor sample_with(const PointSampler& at_points, const GeometryPtr& geometry, SampleLocation at,
                   const ExtrapolationPtr& boundary, const SampleOptions& options) {
    const Tensor points = sample_points(geometry, at, boundary);
    if (at == SampleLocation::Face && geometry->type() == GeometryType::UniformGrid) {
        const Dim& faces = points.shape().dim(dims::DUAL_VECTOR);
        std::vector<Tensor> components;
        for (Index i = 0; i < faces.size; ++i) {
            Tensor v = at_points(points.component(i, dims::DUAL_VECTOR));
            if (v.shape().contains(dims::VECTOR)) {
                v = v.slice(Selection{{dims::VECTOR, faces.item_names[static_cast<std::size_t>(i)]}});
            }
            components.push_back(v);
        }
        return Tensor::stack(components, faces);
    }
    Tensor values = at_points(points);
    if (at == SampleLocation::Face && options.dot_face_normal) {
        values = project_on_normals(values, *geometry, *boundary);
    }
    return values;
}

void check_target(const GeometryPtr& geometry, const ExtrapolationPtr& boundary) {
    PFL_CHECK_NOT_NULL(geometry, "Target geometry");
    PFL_CHECK_NOT_NULL(boundary, "Target boundary");
}

} // namespace

Tensor sample_points(const GeometryPtr& geometry, SampleLocation at, const ExtrapolationPtr& boundary) {
    check_target(geometry, boundary);
    if (at == SampleLocation::Center) {
        return geometry->center();
    }
    return math::slice_off(geometry->face_centers(), determined_faces(*geometry, *boundary));
}

extrapolation::PadCoordinates sample_coordinates(const UniformGrid& grid, const std::string& face_axis,
                                                 Index skipped_lower) {
    extrapolation::PadCoordinates coords;
    const Tensor lower = grid.bounds()->lower();
    const Tensor dx = grid.dx();
    for (const auto& a : grid.axes()) {
        const Real h = axis_value(dx, a);
        const Real origin = a == face_axis ? axis_value(lower, a) + static_cast<Real>(skipped_lower) * h
                                           : axis_value(lower, a) + Real(0.5) * h;
        coords.axes[a] = {origin, h};
    }
    return coords;
}

Tensor sample(const Field& source, const GeometryPtr& geometry, SampleLocation at,
              const ExtrapolationPtr& boundary, const SampleOptions& options) {
    check_target(geometry, boundary);
    if (source.geometry()->equals(*geometry) && source.sampled_at() == at) {
        return source.with_boundary(boundary).values();
    }
    switch (source.geometry()->type()) {
        case GeometryType::UniformGrid: {
            const auto& grid = static_cast<const UniformGrid&>(*source.geometry());
            return sample_with([&](const Tensor& p) { return sample_grid(source, grid, p); },
                               geometry, at, boundary, options);
        }
        case GeometryType::Mesh: {
            const auto& mesh = static_cast<const Mesh&>(*source.geometry());
            if (mesh.equals(*geometry)) {
                if (at == SampleLocation::Center) {
                    return mesh_cell_values(source, mesh);
                }
                Tensor faces = mesh_face_values(source, mesh, *boundary);
                return options.dot_face_normal ? project_on_normals(faces, mesh, *boundary) : faces;
            }
            PFL_THROW_IF(geometry->type() != GeometryType::UniformGrid, NotImplementedException,
                         std::string("sampling a mesh field onto ") + geometry::to_string(geometry->type()));
            return sample_with([&](const Tensor& p) { return sample_mesh(source, mesh, p); },
                               geometry, at, boundary, options);
        }
        default:
            PFL_THROW_IF(geometry->type() != GeometryType::UniformGrid || at != SampleLocation::Center,
                         NotImplementedException,
                         std::string("sampling a point cloud onto ") + geometry::to_string(geometry->type()) +
                             " " + to_string(at) + "s");
            return scatter(source, static_cast<const UniformGrid&>(*geometry), options.reduce);
    }
}

Tensor sample(const Initializer& initializer, const GeometryPtr& geometry, SampleLocation at,
              const ExtrapolationPtr& boundary, const SampleOptions& options) {
    PFL_CHECK_ARG(static_cast<bool>(initializer), "Initializer is empty");
    return sample_with(initializer, geometry, at, boundary, options);
}

Tensor sample(const GeometryPtr& shape, const GeometryPtr& geometry, SampleLocation at,
              const ExtrapolationPtr& boundary, const SampleOptions& options) {
    PFL_CHECK_NOT_NULL(shape, "Indicator geometry");
    check_target(geometry, boundary);
    Real width = 0;
    if (options.soft) {
        const Tensor radius = geometry->bounding_radius();
        width = Real(2) * radius.reduce(math::ReduceOp::Mean).item();
        if (width <= 0) {
            PFL_LOG_DEBUG("Soft indicator on " + geometry->to_string() + " without extent, sampling hard");
        }
    }
    return sample_with([&](const Tensor& p) {
        if (width <= 0) {
            return shape->lies_inside(p);
        }
        return math::clip(Tensor(Real(0.5)) - shape->approximate_signed_distance(p) / Tensor(width), 0, 1);
    }, geometry, at, boundary, options);
}

Tensor sample(const Tensor& value, const GeometryPtr& geometry, SampleLocation at,
              const ExtrapolationPtr& boundary, const SampleOptions& options) {
    return sample_with([&](const Tensor&) { return value; }, geometry, at, boundary, options);
}

Tensor sample_at_points(const Field& source, const Tensor& points) {
    if (!points.is_uniform()) {
        const Dim& stack = points.shape().dim(points.stack_dim());
        std::vector<Tensor> components;
        for (Index i = 0; i < stack.size; ++i) {
            components.push_back(sample_at_points(source, points.component(i, stack.name)));
        }
        return Tensor::stack(components, stack);
    }
    switch (source.geometry()->type()) {
        case GeometryType::UniformGrid:
            return sample_grid(source, static_cast<const UniformGrid&>(*source.geometry()), points);
        case GeometryType::Mesh:
            return sample_mesh(source, static_cast<const Mesh&>(*source.geometry()), points);
        default:
            PFL_NOT_IMPLEMENTED("sampling a point cloud at arbitrary positions");
    }
}

Field resample(const Field& value, const Field& to, bool keep_extrapolation, const SampleOptions& options) {
    const ExtrapolationPtr& rule = keep_extrapolation ? value.boundary() : to.boundary();
    if (value.geometry()->equals(*to.geometry()) && value.sampled_at() == to.sampled_at() &&
        extrapolation::same(rule, value.boundary())) {
        return value;
    }
    return Field(to.geometry(), value, rule, to.sampled_at(), options);
}

} // namespace field
} // namespace pfl
