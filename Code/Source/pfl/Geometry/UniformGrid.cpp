/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Geometry/UniformGrid.h"
#include "pfl/Geometry/Point.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/VectorOps.h"

#include <algorithm>

namespace pfl {
namespace geometry {

namespace {

math::Tensor resolution_vector(const math::Shape& resolution) {
    std::vector<Real> sizes;
    for (Index n : resolution.sizes()) {
        sizes.push_back(static_cast<Real>(n));
    }
    return math::Tensor::vector(resolution.names(), sizes);
}

} // namespace

UniformGrid::UniformGrid(math::Shape resolution, BoxPtr bounds)
    : resolution_(std::move(resolution)), bounds_(std::move(bounds)) {
    PFL_CHECK_NOT_NULL(bounds_, "UniformGrid bounds");
    PFL_CHECK_ARG(bounds_->is_axis_aligned(), "UniformGrid bounds must be axis-aligned");
    PFL_CHECK_ARG(!resolution_.empty() && resolution_.spatial().rank() == resolution_.rank(),
                  "UniformGrid resolution must consist of spatial dimensions, got " + resolution_.to_string());
    axes_ = resolution_.names();
    auto bound_axes = bounds_->vector_axes();
    if (bound_axes != axes_) {
        auto sorted_a = axes_;
        auto sorted_b = bound_axes;
        std::sort(sorted_a.begin(), sorted_a.end());
        std::sort(sorted_b.begin(), sorted_b.end());
        PFL_CHECK_ARG(sorted_a == sorted_b, "UniformGrid bounds axes do not match the resolution "
                                            + resolution_.to_string());
        math::Selection order{{dims::VECTOR, axes_}};
        bounds_ = std::make_shared<const Box>(bounds_->lower().slice(order), bounds_->upper().slice(order));
    }
}

UniformGrid::UniformGrid(math::Shape resolution)
    : UniformGrid(resolution,
                  std::make_shared<const Box>(math::Tensor::zeros(math::Shape{math::vector_dim(resolution.names())}),
                                              resolution_vector(resolution))) {}

math::Shape UniformGrid::compute_shape() const {
    return resolution_ & bounds_->shape();
}

math::Tensor UniformGrid::dx() const {
    return bounds_->size() / resolution_vector(resolution_);
}

math::Tensor UniformGrid::lower(const std::string& axis) const {
    return bounds_->lower().slice(math::Selection{{dims::VECTOR, axis}});
}

math::Tensor UniformGrid::spacing(const std::string& axis) const {
    return dx().slice(math::Selection{{dims::VECTOR, axis}});
}

math::Tensor UniformGrid::axis_positions(const std::string& axis, Index count, Real offset) const {
    math::Tensor index = math::Tensor::arange(math::spatial(axis, count));
    return lower(axis) + (index + offset) * spacing(axis);
}

math::Tensor UniformGrid::center() const {
    return center_.get([this]() {
        std::vector<math::Tensor> components;
        for (const auto& a : axes_) {
            components.push_back(axis_positions(a, resolution_.size(a), Real(0.5)));
        }
        return math::vec(axes_, components);
    });
}

math::Tensor UniformGrid::volume() const {
    return vector_product(dx());
}

math::Tensor UniformGrid::lies_inside(const math::Tensor& location) const {
    return bounds_->lies_inside(location);
}

math::Tensor UniformGrid::approximate_signed_distance(const math::Tensor& location) const {
    return bounds_->approximate_signed_distance(location);
}

ClosestSurface UniformGrid::approximate_closest_surface(const math::Tensor& location) const {
    return bounds_->approximate_closest_surface(location);
}

math::Tensor UniformGrid::bounding_radius() const {
    return math::vec_length(dx()) * Real(0.5);
}

math::Tensor UniformGrid::bounding_half_extent() const {
    return dx() * Real(0.5);
}

GeometryPtr UniformGrid::at(const math::Tensor&) const {
    PFL_NOT_IMPLEMENTED("UniformGrid::at; use shifted() to move a grid");
}

GeometryPtr UniformGrid::shifted(const math::Tensor& delta) const {
    PFL_CHECK_SHAPE(delta.shape().spatial().empty(),
                    "UniformGrid can only be shifted uniformly, got delta " + delta.shape().to_string());
    return std::make_shared<const UniformGrid>(resolution_,
                                               std::static_pointer_cast<const Box>(bounds_->shifted(delta)));
}

GeometryPtr UniformGrid::rotated(const math::Tensor&) const {
    PFL_NOT_IMPLEMENTED("rotation of a UniformGrid");
}

GeometryPtr UniformGrid::scaled(const math::Tensor& factor) const {
    return std::make_shared<const UniformGrid>(resolution_,
                                               std::static_pointer_cast<const Box>(bounds_->scaled(factor)));
}

GeometryPtr UniformGrid::slice(const math::Selection& selection) const {
    std::vector<std::string> keep = axes_;
    auto vector_item = selection.find(dims::VECTOR);
    if (vector_item != selection.end()) {
        const math::SliceItem& item = vector_item->second;
        if (std::holds_alternative<std::string>(item)) {
            keep = {std::get<std::string>(item)};
        } else if (std::holds_alternative<std::vector<std::string>>(item)) {
            keep = std::get<std::vector<std::string>>(item);
        } else if (std::holds_alternative<Index>(item)) {
            Index i = math::wrap_index(std::get<Index>(item), static_cast<Index>(axes_.size()));
            PFL_THROW_IF(i < 0 || i >= static_cast<Index>(axes_.size()), OutOfRangeException,
                         "Vector index out of range for UniformGrid");
            keep = {axes_[static_cast<std::size_t>(i)]};
        } else {
            PFL_NOT_IMPLEMENTED("range selection of UniformGrid axes");
        }
    }

    // Batch dimensions of the bounds
    math::Selection batch_selection;
    for (const auto& [name, item] : selection) {
        if (name != dims::VECTOR && !resolution_.contains(name)) {
            batch_selection.emplace(name, item);
        }
    }
    math::Tensor grid_dx = dx().slice(batch_selection);
    math::Tensor box_lower = bounds_->lower().slice(batch_selection);
    math::Tensor box_upper = bounds_->upper().slice(batch_selection);

    std::vector<math::Dim> new_resolution;
    std::vector<std::string> new_axes;
    std::vector<math::Tensor> lowers;
    std::vector<math::Tensor> uppers;
    for (const auto& a : axes_) {
        if (std::find(keep.begin(), keep.end(), a) == keep.end()) {
            continue;
        }
        PFL_CHECK_ARG(resolution_.contains(a), "Unknown axis '" + a + "'");
        math::Selection pick{{dims::VECTOR, a}};
        math::Tensor lo = box_lower.slice(pick);
        math::Tensor hi = box_upper.slice(pick);
        math::Tensor step = grid_dx.slice(pick);
        Index n = resolution_.size(a);
        auto it = selection.find(a);
        if (it == selection.end()) {
            new_resolution.push_back(resolution_.dim(a));
        } else if (std::holds_alternative<Index>(it->second)) {
            Index i = math::wrap_index(std::get<Index>(it->second), n);
            PFL_THROW_IF(i < 0 || i >= n, OutOfRangeException,
                         "Index " + std::to_string(i) + " out of range for grid dimension '" + a + "'");
            continue;
        } else if (std::holds_alternative<math::Range>(it->second)) {
            const math::Range& r = std::get<math::Range>(it->second);
            Index start = std::clamp<Index>(math::wrap_index(r.start.value_or(0), n), 0, n);
            Index stop = std::clamp<Index>(math::wrap_index(r.stop.value_or(n), n), start, n);
            new_resolution.push_back(math::spatial(a, stop - start));
            hi = lo + step * static_cast<Real>(stop);
            lo = lo + step * static_cast<Real>(start);
        } else {
            PFL_THROW(InvalidArgumentException, "Grid dimension '" + a + "' has no item names");
        }
        new_axes.push_back(a);
        lowers.push_back(lo);
        uppers.push_back(hi);
    }
    PFL_CHECK_ARG(!new_axes.empty(), "Slicing would remove every axis of the grid");
    auto box = std::make_shared<const Box>(math::vec(new_axes, lowers), math::vec(new_axes, uppers));
    return std::make_shared<const UniformGrid>(math::Shape(new_resolution), box);
}

math::Tensor UniformGrid::sample_uniform(const math::Shape& samples) const {
    return bounds_->sample_uniform(samples);
}

GeometryPtr UniformGrid::faces() const {
    return std::make_shared<const Point>(face_centers());
}

math::Tensor UniformGrid::face_centers() const {
    return face_centers_.get([this]() {
        std::vector<math::Tensor> per_normal;
        for (const auto& normal_axis : axes_) {
            std::vector<math::Tensor> components;
            for (const auto& a : axes_) {
                components.push_back(a == normal_axis
                                         ? axis_positions(a, resolution_.size(a) + 1, Real(0))
                                         : axis_positions(a, resolution_.size(a), Real(0.5)));
            }
            per_normal.push_back(math::vec(axes_, components));
        }
        return math::Tensor::stack(per_normal, math::dual(dims::VECTOR, axes_));
    });
}

math::Tensor UniformGrid::face_areas() const {
    math::Tensor d = dx();
    std::vector<math::Tensor> areas;
    for (const auto& normal_axis : axes_) {
        math::Tensor area(Real(1));
        for (const auto& a : axes_) {
            if (a != normal_axis) {
                area = area * d.slice(math::Selection{{dims::VECTOR, a}});
            }
        }
        areas.push_back(area);
    }
    return math::Tensor::stack(areas, math::dual(dims::VECTOR, axes_));
}

math::Tensor UniformGrid::face_normals() const {
    return math::identity_matrix(axes_);
}

math::Shape UniformGrid::face_shape() const {
    return shape() & math::Shape{math::dual(dims::VECTOR, axes_)};
}

BoundarySlices UniformGrid::boundary_elements() const {
    BoundarySlices slices;
    for (const auto& a : axes_) {
        slices[a + "-"] = math::Selection{{a, math::range(0, 1)}};
        slices[a + "+"] = math::Selection{{a, math::range_from(-1)}};
    }
    return slices;
}

BoundarySlices UniformGrid::boundary_faces() const {
    BoundarySlices slices;
    for (const auto& a : axes_) {
        slices[a + "-"] = math::Selection{{dims::DUAL_VECTOR, a}, {a, math::range(0, 1)}};
        slices[a + "+"] = math::Selection{{dims::DUAL_VECTOR, a}, {a, math::range_from(-1)}};
    }
    return slices;
}

UniformGridPtr UniformGrid::padded(const std::map<std::string, std::pair<Index, Index>>& widths) const {
    math::Tensor d = dx();
    math::Shape resolution = resolution_;
    std::vector<math::Tensor> lowers;
    std::vector<math::Tensor> uppers;
    for (const auto& a : axes_) {
        math::Selection pick{{dims::VECTOR, a}};
        math::Tensor lo = bounds_->lower().slice(pick);
        math::Tensor hi = bounds_->upper().slice(pick);
        auto it = widths.find(a);
        if (it != widths.end()) {
            const auto [below, above] = it->second;
            PFL_CHECK_ARG(resolution_.size(a) + below + above >= 0, "Padding would remove every cell along '" + a + "'");
            resolution = resolution.with_size(a, resolution_.size(a) + below + above);
            math::Tensor step = d.slice(pick);
            lo = lo - step * static_cast<Real>(below);
            hi = hi + step * static_cast<Real>(above);
        }
        lowers.push_back(lo);
        uppers.push_back(hi);
    }
    auto box = std::make_shared<const Box>(math::vec(axes_, lowers), math::vec(axes_, uppers));
    return std::make_shared<const UniformGrid>(resolution, box);
}

bool UniformGrid::equals(const Geometry& other) const {
    if (other.type() != GeometryType::UniformGrid) {
        return false;
    }
    const auto& grid = static_cast<const UniformGrid&>(other);
    return resolution_ == grid.resolution_ && bounds_->equals(*grid.bounds_);
}

std::string UniformGrid::to_string() const {
    return "UniformGrid" + resolution_.to_string() + " " + bounds_->to_string();
}

} // namespace geometry
} // namespace pfl
