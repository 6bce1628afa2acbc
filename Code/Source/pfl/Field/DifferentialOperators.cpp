/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Field/DifferentialOperators.h"
#include "pfl/Field/Resample.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Geometry/UniformGrid.h"
#include "pfl/Math/VectorOps.h"

#include <algorithm>
#include <mutex>
#include <optional>
#include <set>
#include <utility>

namespace pfl {
namespace field {

using geometry::UniformGrid;
using math::Range;
using math::Selection;
using math::Tensor;

namespace {

const UniformGrid& require_grid(const Field& field, const std::string& operation) {
    PFL_THROW_IF(!field.is_grid(), NotImplementedException, operation + " of " + field.to_string());
    return static_cast<const UniformGrid&>(*field.geometry());
}

void require_order(int order) {
    PFL_THROW_IF(order != 2, NotImplementedException, "finite differences of order " + std::to_string(order));
}

Real spacing(const UniformGrid& grid, const std::string& axis) {
    return grid.dx().slice(Selection{{dims::VECTOR, axis}}).item();
}

/// Centered values with one extra cell on both sides of every axis
Tensor padded_centers(const Field& field, const UniformGrid& grid) {
    extrapolation::PadWidths widths;
    for (const auto& a : grid.axes()) {
        widths[a] = {1, 1};
    }
    extrapolation::PadCoordinates coords = sample_coordinates(grid);
    return field.boundary()->pad(field.values(), widths, &coords);
}

/// Interior of a padded tensor, shifted by `shift` cells along `axis`
Tensor interior(const Tensor& padded, const std::vector<std::string>& axes, const std::string& axis, Index shift) {
    Selection selection;
    for (const auto& a : axes) {
        const Index n = padded.shape().size(a) - 2;
        selection[a] = a == axis ? math::range(1 + shift, 1 + shift + n) : math::range(1, 1 + n);
    }
    return padded.slice(selection);
}

/// Entries `start`, `start + 2`, ... along `dim`
Tensor every_other(const Tensor& value, const std::string& dim, Index start) {
    const Index n = value.shape().size(dim);
    std::vector<std::string> items;
    std::vector<std::string> picked;
    for (Index i = 0; i < n; ++i) {
        items.push_back(std::to_string(i));
        if (i >= start && (i - start) % 2 == 0) {
            picked.push_back(std::to_string(i));
        }
    }
    return value.with_item_names(dim, items).slice(Selection{{dim, picked}}).with_item_names(dim, {});
}

/// Faces stored under `rule` out of all faces normal to `axis`
Tensor stored_faces(const Tensor& faces, const extrapolation::Extrapolation& rule, const std::string& axis) {
    const auto [lower_stored, upper_stored] = rule.valid_outer_faces(axis);
    return faces.slice(Selection{{axis, Range{Index(lower_stored ? 0 : 1),
                                              upper_stored ? std::optional<Index>() : std::optional<Index>(-1)}}});
}

std::shared_ptr<const UniformGrid> coarser(const UniformGrid& grid) {
    math::Shape resolution = grid.resolution();
    for (const auto& a : grid.axes()) {
        const Index n = resolution.size(a);
        PFL_THROW_IF(n % 2 != 0, InvalidArgumentException,
                     "Cannot halve odd resolution " + std::to_string(n) + " along '" + a + "'");
        resolution = resolution.with_size(a, n / 2);
    }
    return std::make_shared<const UniformGrid>(resolution, grid.bounds());
}

} // namespace

Field FiniteDifferenceOperators::gradient(const Field& field, const GradientOptions& options) const {
    const UniformGrid& grid = require_grid(field, "gradient");
    require_order(options.order);
    PFL_THROW_IF(field.is_staggered(), NotImplementedException, "gradient of staggered " + field.to_string());
    PFL_THROW_IF(field.values().shape().contains(dims::VECTOR), NotImplementedException,
                 "gradient of vector " + field.to_string());
    const std::vector<std::string> axes = options.dims.empty() ? grid.axes() : options.dims;
    ExtrapolationPtr rule = options.boundary != nullptr ? options.boundary : field.boundary()->spatial_gradient();
    const Tensor padded = padded_centers(field, grid);

    if (options.at == SampleLocation::Center) {
        std::vector<Tensor> components;
        for (const auto& a : axes) {
            components.push_back((interior(padded, grid.axes(), a, 1) - interior(padded, grid.axes(), a, -1)) /
                                 (Real(2) * spacing(grid, a)));
        }
        return Field(field.geometry(), math::vec(axes, components), rule);
    }

    PFL_THROW_IF(std::set<std::string>(axes.begin(), axes.end()) !=
                     std::set<std::string>(grid.axes().begin(), grid.axes().end()),
                 NotImplementedException, "face gradient along a subset of the axes");
    std::vector<Tensor> components;
    for (const auto& a : grid.axes()) {
        // n + 1 faces lie between the n + 2 padded cells
        Selection lower;
        Selection upper;
        for (const auto& b : grid.axes()) {
            const Index n = padded.shape().size(b) - 2;
            lower[b] = b == a ? math::range(0, n + 1) : math::range(1, n + 1);
            upper[b] = b == a ? math::range(1, n + 2) : math::range(1, n + 1);
        }
        Tensor faces = (padded.slice(upper) - padded.slice(lower)) / spacing(grid, a);
        components.push_back(stored_faces(faces, *rule, a));
    }
    return Field(field.geometry(), Tensor::stack(components, math::dual(dims::VECTOR, grid.axes())), rule,
                 SampleLocation::Face);
}

Field FiniteDifferenceOperators::divergence(const Field& field, int order) const {
    const UniformGrid& grid = require_grid(field, "divergence");
    require_order(order);
    ExtrapolationPtr rule = field.boundary()->spatial_gradient();
    Tensor total(Real(0));
    if (field.is_staggered()) {
        const Tensor faces = field.staggered_tensor();
        for (const auto& a : grid.axes()) {
            const Tensor component = faces.slice(Selection{{dims::VECTOR, a}});
            Selection lower;
            Selection upper;
            for (const auto& b : grid.axes()) {
                const Index n = grid.resolution().size(b);
                lower[b] = math::range(0, n);
                upper[b] = b == a ? math::range(1, n + 1) : math::range(0, n);
            }
            total = total + (component.slice(upper) - component.slice(lower)) / spacing(grid, a);
        }
        return Field(field.geometry(), total, rule);
    }
    PFL_THROW_IF(!field.values().shape().contains(dims::VECTOR), InvalidArgumentException,
                 "divergence needs a vector field, got " + field.to_string());
    const Tensor padded = padded_centers(field, grid);
    for (const auto& a : grid.axes()) {
        const Tensor component = padded.slice(Selection{{dims::VECTOR, a}});
        total = total + (interior(component, grid.axes(), a, 1) - interior(component, grid.axes(), a, -1)) /
                            (Real(2) * spacing(grid, a));
    }
    return Field(field.geometry(), total, rule);
}

Field FiniteDifferenceOperators::curl(const Field& field) const {
    const UniformGrid& grid = require_grid(field, "curl");
    PFL_THROW_IF(grid.axes().size() != 2, NotImplementedException,
                 "curl in " + std::to_string(grid.axes().size()) + " dimensions");
    const Field faces = field.is_staggered() ? field : field.at_faces();
    const std::string& x = grid.axes()[0];
    const std::string& y = grid.axes()[1];
    const Real hx = spacing(grid, x);
    const Real hy = spacing(grid, y);

    extrapolation::PadCoordinates y_coords = sample_coordinates(grid, y);
    const Tensor vy = faces.boundary()->component(y)->pad(faces.face_component(y), {{x, {1, 1}}}, &y_coords);
    extrapolation::PadCoordinates x_coords = sample_coordinates(grid, x);
    const Tensor vx = faces.boundary()->component(x)->pad(faces.face_component(x), {{y, {1, 1}}}, &x_coords);

    const Index nx = grid.resolution().size(x);
    const Index ny = grid.resolution().size(y);
    const Tensor dvy_dx = (vy.slice(Selection{{x, math::range(1, nx + 2)}}) -
                           vy.slice(Selection{{x, math::range(0, nx + 1)}})) / hx;
    const Tensor dvx_dy = (vx.slice(Selection{{y, math::range(1, ny + 2)}}) -
                           vx.slice(Selection{{y, math::range(0, ny + 1)}})) / hy;

    const Tensor half = grid.dx() * Real(0.5);
    auto corners = std::make_shared<const UniformGrid>(
        grid.resolution().with_size(x, nx + 1).with_size(y, ny + 1),
        std::make_shared<const geometry::Box>(grid.bounds()->lower() - half, grid.bounds()->upper() + half));
    return Field(corners, dvy_dx - dvx_dy, faces.boundary()->spatial_gradient());
}

Field FiniteDifferenceOperators::laplace(const Field& field, const std::vector<std::string>& dims, int order) const {
    const UniformGrid& grid = require_grid(field, "laplace");
    require_order(order);
    PFL_THROW_IF(field.is_staggered(), NotImplementedException, "laplace of staggered " + field.to_string());
    const std::vector<std::string> axes = dims.empty() ? grid.axes() : dims;
    const Tensor padded = padded_centers(field, grid);
    const Tensor center = interior(padded, grid.axes(), grid.axes().front(), 0);
    Tensor total(Real(0));
    for (const auto& a : axes) {
        const Real h = spacing(grid, a);
        total = total + (interior(padded, grid.axes(), a, 1) - center * Real(2) + interior(padded, grid.axes(), a, -1)) /
                            (h * h);
    }
    return Field(field.geometry(), total, field.boundary()->spatial_gradient());
}

Field FiniteDifferenceOperators::downsample2x(const Field& field) const {
    const UniformGrid& grid = require_grid(field, "downsampling");
    auto target = coarser(grid);
    if (field.is_centered()) {
        Tensor values = field.values();
        for (const auto& a : grid.axes()) {
            values = (every_other(values, a, 0) + every_other(values, a, 1)) * Real(0.5);
        }
        return Field(target, values, field.boundary());
    }
    std::vector<Tensor> components;
    for (const auto& a : grid.axes()) {
        Tensor faces = every_other(field.face_component(a), a, 0);
        for (const auto& b : grid.axes()) {
            if (b != a) {
                faces = (every_other(faces, b, 0) + every_other(faces, b, 1)) * Real(0.5);
            }
        }
        components.push_back(stored_faces(faces, *field.boundary(), a));
    }
    return Field(target, Tensor::stack(components, math::dual(dims::VECTOR, grid.axes())), field.boundary(),
                 SampleLocation::Face);
}

namespace {

std::mutex operators_mutex;

DifferentialOperatorsPtr& active_operators() {
    static DifferentialOperatorsPtr operators = std::make_shared<const FiniteDifferenceOperators>();
    return operators;
}

} // namespace

DifferentialOperatorsPtr differential_operators() {
    std::lock_guard<std::mutex> lock(operators_mutex);
    return active_operators();
}

void set_differential_operators(DifferentialOperatorsPtr operators) {
    std::lock_guard<std::mutex> lock(operators_mutex);
    active_operators() = operators != nullptr ? std::move(operators)
                                              : std::make_shared<const FiniteDifferenceOperators>();
}

} // namespace field
} // namespace pfl
