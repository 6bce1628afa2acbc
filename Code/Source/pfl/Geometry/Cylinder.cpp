/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Geometry/Cylinder.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/VectorOps.h"

#include <algorithm>

namespace pfl {
namespace geometry {

namespace {

math::Selection select_axes(const std::vector<std::string>& axes) {
    return math::Selection{{dims::VECTOR, axes}};
}

math::Selection select_axis(const std::string& axis) {
    return math::Selection{{dims::VECTOR, axis}};
}

} // namespace

Cylinder::Cylinder(math::Tensor center, math::Tensor radius, math::Tensor depth,
                   std::optional<math::Tensor> rotation, std::string axis)
    : center_(std::move(center)),
      radius_(std::move(radius)),
      depth_(std::move(depth)),
      axis_(std::move(axis)) {
    PFL_CHECK_ARG(center_.shape().contains(dims::VECTOR), "Cylinder center needs a 'vector' dimension");
    PFL_CHECK_ARG(!radius_.shape().contains(dims::VECTOR), "Cylinder radius must not vary along 'vector'");
    const auto& axes = center_.shape().item_names(dims::VECTOR);
    PFL_CHECK_ARG(std::find(axes.begin(), axes.end(), axis_) != axes.end(),
                  "Cylinder axis '" + axis_ + "' is not one of the center's vector items");
    for (const auto& a : axes) {
        if (a != axis_) {
            radial_axes_.push_back(a);
        }
    }
    if (rotation) {
        rotation_ = math::rotation_matrix(*rotation, axes);
    }
}

math::Shape Cylinder::compute_shape() const {
    math::Shape shape = center_.shape() & radius_.shape() & depth_.shape();
    if (rotation_) {
        shape = shape & rotation_->shape().without(std::vector<std::string>{dims::VECTOR, dims::DUAL_VECTOR});
    }
    return fill_spatial_with_singleton(shape).without(dims::VECTOR);
}

const math::Tensor& Cylinder::up() const {
    return up_.get([this]() {
        const auto axes = vector_axes();
        std::vector<Real> unit(axes.size(), Real(0));
        unit[static_cast<std::size_t>(std::find(axes.begin(), axes.end(), axis_) - axes.begin())] = Real(1);
        return math::rotate_vector(math::Tensor::vector(axes, unit), rotation_);
    });
}

math::Tensor Cylinder::assemble(const math::Tensor& axial, const math::Tensor& radial) const {
    const auto axes = vector_axes();
    std::vector<math::Tensor> components;
    components.reserve(axes.size());
    for (const auto& a : axes) {
        components.push_back(a == axis_ ? axial : radial.slice(select_axis(a)));
    }
    return math::vec(axes, components);
}

math::Tensor Cylinder::volume() const {
    return volume_.get([this]() { return ball_volume(radius_, spatial_rank() - 1) * depth_; });
}

math::Tensor Cylinder::lies_inside(const math::Tensor& location) const {
    math::Tensor pos = math::rotate_vector(location - center_, rotation_, true);
    math::Tensor r = pos.slice(select_axes(radial_axes_));
    math::Tensor h = pos.slice(select_axis(axis_));
    math::Tensor half_depth = depth_ * Real(0.5);
    math::Tensor inside = math::binary(math::vec_squared(r), radius_ * radius_, math::BinaryOp::LessEqual) *
                          math::binary(h, -half_depth, math::BinaryOp::GreaterEqual) *
                          math::binary(h, half_depth, math::BinaryOp::LessEqual);
    return inside.any(instance_names(shape()));
}

math::Tensor Cylinder::approximate_signed_distance(const math::Tensor& location) const {
    math::Tensor pos = math::rotate_vector(location - center_, rotation_, true);
    math::Tensor r = pos.slice(select_axes(radial_axes_));
    math::Tensor h = pos.slice(select_axis(axis_));
    math::Tensor cap_distance = math::abs(h) - depth_ * Real(0.5);
    math::Tensor lateral_distance = math::vec_length(r) - radius_;
    // Inside means both are negative
    return math::maximum(lateral_distance, cap_distance).min(instance_names(shape()));
}

ClosestSurface Cylinder::approximate_closest_surface(const math::Tensor& location) const {
    math::Tensor pos = math::rotate_vector(location - center_, rotation_, true);
    math::Tensor r = pos.slice(select_axes(radial_axes_));
    math::Tensor h = pos.slice(select_axis(axis_));
    math::Tensor top = depth_ * Real(0.5);
    math::Tensor bottom = -top;

    math::Tensor radial_outward = math::vec_normalize(r);
    math::Tensor surface_r = radial_outward * radius_;
    math::Tensor inside_radius = math::binary(math::vec_squared(r), radius_ * radius_, math::BinaryOp::LessEqual);
    math::Tensor clamped_r = math::where(inside_radius, r, surface_r);

    // Closest point on the caps
    math::Tensor above = math::binary(h, Real(0), math::BinaryOp::GreaterEqual);
    math::Tensor on_cap = assemble(math::where(above, top, bottom), clamped_r);
    math::Tensor local_up = assemble(Real(1), math::Tensor::zeros(math::Shape{math::vector_dim(radial_axes_)}));
    math::Tensor cap_normal = math::where(above, local_up, -local_up);

    // Closest point on the lateral surface
    math::Tensor clamped_h = math::minimum(math::maximum(h, bottom), top);
    math::Tensor on_lateral = assemble(clamped_h, surface_r);
    math::Tensor lateral_normal = assemble(Real(0), radial_outward);

    // Signed distances of caps and lateral surface can disagree in sign near the edges
    math::Tensor cap_distance = math::vec_length(on_cap - pos);
    math::Tensor lateral_distance = math::vec_length(on_lateral - pos);
    math::Tensor cap_closer = math::binary(cap_distance, lateral_distance, math::BinaryOp::LessEqual);

    math::Tensor inside = inside_radius *
                          math::binary(h, bottom, math::BinaryOp::GreaterEqual) *
                          math::binary(h, top, math::BinaryOp::LessEqual);

    ClosestSurface pieces;
    pieces.signed_distance = math::minimum(cap_distance, lateral_distance) * math::where(inside, Real(-1), Real(1));
    pieces.delta = math::rotate_vector(math::where(cap_closer, on_cap, on_lateral) - pos, rotation_);
    pieces.normal = math::rotate_vector(math::where(cap_closer, cap_normal, lateral_normal), rotation_);
    return closest_of(pieces, instance_names(shape()));
}

math::Tensor Cylinder::bounding_radius() const {
    math::Tensor half_depth = depth_ * Real(0.5);
    return math::sqrt(radius_ * radius_ + half_depth * half_depth);
}

math::Tensor Cylinder::bounding_half_extent() const {
    const math::Shape vector_shape{math::vector_dim(vector_axes())};
    if (rotation_) {
        return bounding_radius().expand(vector_shape);
    }
    return assemble(depth_ * Real(0.5), radius_.expand(math::Shape{math::vector_dim(radial_axes_)}));
}

GeometryPtr Cylinder::at(const math::Tensor& center) const {
    return std::make_shared<const Cylinder>(center, radius_, depth_, rotation_, axis_);
}

GeometryPtr Cylinder::rotated(const math::Tensor& angle) const {
    if (!rotation_) {
        return std::make_shared<const Cylinder>(center_, radius_, depth_, angle, axis_);
    }
    math::Tensor matrix = math::matrix_product(*rotation_, math::rotation_matrix(angle, vector_axes()));
    return std::make_shared<const Cylinder>(center_, radius_, depth_, matrix, axis_);
}

GeometryPtr Cylinder::scaled(const math::Tensor& factor) const {
    return std::make_shared<const Cylinder>(center_, radius_ * factor, depth_ * factor, rotation_, axis_);
}

GeometryPtr Cylinder::slice(const math::Selection& selection) const {
    math::Selection sel = without_vector(selection);
    sel.erase(dims::DUAL_VECTOR);
    std::optional<math::Tensor> rotation;
    if (rotation_) {
        rotation = rotation_->slice(sel);
    }
    return std::make_shared<const Cylinder>(center_.slice(sel), radius_.slice(sel), depth_.slice(sel),
                                            rotation, axis_);
}

math::Shape Cylinder::face_shape() const {
    return shape() & math::Shape{math::dual("shell", {"bottom", "top", "lateral"})};
}

bool Cylinder::equals(const Geometry& other) const {
    if (other.type() != GeometryType::Cylinder) {
        return false;
    }
    const auto& cyl = static_cast<const Cylinder&>(other);
    if (axis_ != cyl.axis_ || shape() != cyl.shape() || rotation_.has_value() != cyl.rotation_.has_value()) {
        return false;
    }
    if (rotation_ && !math::close(*rotation_, *cyl.rotation_)) {
        return false;
    }
    return math::close(center_, cyl.center_) && math::close(radius_, cyl.radius_) &&
           math::close(depth_, cyl.depth_);
}

std::string Cylinder::to_string() const {
    return "Cylinder(center=" + center_.to_string() + ", radius=" + radius_.to_string() +
           ", depth=" + depth_.to_string() + ", axis=" + axis_ + (rotation_ ? ", rotated" : "") + ")";
}

} // namespace geometry
} // namespace pfl
