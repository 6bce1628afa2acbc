/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Geometry/GeometryStack.h"
#include "pfl/Geometry/Box.h"
#include "pfl/Geometry/Cylinder.h"
#include "pfl/Geometry/Point.h"
#include "pfl/Geometry/Sphere.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/VectorOps.h"

#include <algorithm>

namespace pfl {
namespace geometry {

GeometryStack::GeometryStack(std::vector<GeometryPtr> geometries, math::Dim dim)
    : geometries_(std::move(geometries)), dim_(std::move(dim)) {
    PFL_CHECK_ARG(!geometries_.empty(), "Cannot stack an empty list of geometries");
    for (const auto& g : geometries_) {
        PFL_CHECK_NOT_NULL(g, "Stacked geometry");
    }
    dim_.size = static_cast<Index>(geometries_.size());
    PFL_CHECK_ARG(dim_.item_names.empty() || static_cast<Index>(dim_.item_names.size()) == dim_.size,
                  "Stack dimension '" + dim_.name + "' item names do not match the number of geometries");
    const auto axes = geometries_.front()->vector_axes();
    for (const auto& g : geometries_) {
        PFL_CHECK_ARG(g->vector_axes() == axes, "Stacked geometries must share their spatial axes");
    }
}

math::Shape GeometryStack::compute_shape() const {
    math::Shape merged;
    for (const auto& g : geometries_) {
        math::Shape next;
        if (merged.try_merge(g->shape(), next)) {
            merged = next;
        }
    }
    return merged.with_dim(dim_);
}

template<typename PerMember>
math::Tensor GeometryStack::collect(PerMember&& per_member) const {
    std::vector<math::Tensor> values;
    values.reserve(geometries_.size());
    for (const auto& g : geometries_) {
        values.push_back(per_member(*g));
    }
    return math::Tensor::stack(values, dim_);
}

template<typename Transform>
GeometryPtr GeometryStack::transform_each(const math::Tensor& arg, Transform&& transform) const {
    std::vector<GeometryPtr> result;
    result.reserve(geometries_.size());
    for (std::size_t i = 0; i < geometries_.size(); ++i) {
        math::Tensor member_arg = arg.slice(math::Selection{{dim_.name, static_cast<Index>(i)}});
        result.push_back(transform(*geometries_[i], member_arg));
    }
    return std::make_shared<const GeometryStack>(std::move(result), dim_);
}

math::Tensor GeometryStack::center() const {
    return collect([](const Geometry& g) { return g.center(); });
}

math::Tensor GeometryStack::volume() const {
    return collect([](const Geometry& g) { return g.volume(); });
}

math::Tensor GeometryStack::lies_inside(const math::Tensor& location) const {
    math::Tensor inside = collect([&location](const Geometry& g) { return g.lies_inside(location); });
    return is_union() ? inside.any({dim_.name}) : inside;
}

math::Tensor GeometryStack::approximate_signed_distance(const math::Tensor& location) const {
    math::Tensor distance = collect([&location](const Geometry& g) {
        return g.approximate_signed_distance(location);
    });
    return is_union() ? distance.min({dim_.name}) : distance;
}

ClosestSurface GeometryStack::approximate_closest_surface(const math::Tensor& location) const {
    std::vector<math::Tensor> distance;
    std::vector<math::Tensor> delta;
    std::vector<math::Tensor> normal;
    for (const auto& g : geometries_) {
        ClosestSurface s = g->approximate_closest_surface(location);
        distance.push_back(s.signed_distance);
        delta.push_back(s.delta);
        normal.push_back(s.normal);
    }
    ClosestSurface pieces{math::Tensor::stack(distance, dim_), math::Tensor::stack(delta, dim_),
                          math::Tensor::stack(normal, dim_)};
    return is_union() ? closest_of(pieces, {dim_.name}) : pieces;
}

math::Tensor GeometryStack::bounding_radius() const {
    return collect([](const Geometry& g) { return g.bounding_radius(); });
}

math::Tensor GeometryStack::bounding_half_extent() const {
    return collect([](const Geometry& g) { return g.bounding_half_extent(); });
}

GeometryPtr GeometryStack::at(const math::Tensor& center) const {
    return transform_each(center, [](const Geometry& g, const math::Tensor& c) { return g.at(c); });
}

GeometryPtr GeometryStack::shifted(const math::Tensor& delta) const {
    return transform_each(delta, [](const Geometry& g, const math::Tensor& d) { return g.shifted(d); });
}

GeometryPtr GeometryStack::rotated(const math::Tensor& angle) const {
    return transform_each(angle, [](const Geometry& g, const math::Tensor& a) { return g.rotated(a); });
}

GeometryPtr GeometryStack::scaled(const math::Tensor& factor) const {
    return transform_each(factor, [](const Geometry& g, const math::Tensor& f) { return g.scaled(f); });
}

GeometryPtr GeometryStack::slice(const math::Selection& selection) const {
    math::Selection rest = selection;
    auto own = rest.find(dim_.name);
    if (own == rest.end()) {
        std::vector<GeometryPtr> sliced;
        for (const auto& g : geometries_) {
            sliced.push_back(g->slice(rest));
        }
        return std::make_shared<const GeometryStack>(std::move(sliced), dim_);
    }
    math::Tensor ids = math::Tensor::arange(dim_).slice(math::Selection{{dim_.name, own->second}});
    rest.erase(own);
    if (!ids.shape().contains(dim_.name)) {
        return geometries_[static_cast<std::size_t>(ids.item())]->slice(rest);
    }
    std::vector<GeometryPtr> picked;
    for (Real id : ids.to_vector()) {
        picked.push_back(geometries_[static_cast<std::size_t>(id)]->slice(rest));
    }
    return std::make_shared<const GeometryStack>(std::move(picked), ids.shape().dim(dim_.name));
}

bool GeometryStack::equals(const Geometry& other) const {
    if (other.type() != GeometryType::Stack) {
        return false;
    }
    const auto& s = static_cast<const GeometryStack&>(other);
    if (dim_ != s.dim_) {
        return false;
    }
    return std::equal(geometries_.begin(), geometries_.end(), s.geometries_.begin(),
                      [](const GeometryPtr& a, const GeometryPtr& b) { return a->equals(*b); });
}

std::string GeometryStack::to_string() const {
    std::string s = "GeometryStack(" + dim_.name + ": ";
    for (std::size_t i = 0; i < geometries_.size(); ++i) {
        s += (i ? ", " : "") + geometries_[i]->to_string();
    }
    return s + ")";
}

// ============================================================================
// Stacking
// ============================================================================

namespace {

template<typename T, typename Getter>
std::vector<math::Tensor> gather(const std::vector<GeometryPtr>& geometries, Getter&& getter) {
    std::vector<math::Tensor> values;
    values.reserve(geometries.size());
    for (const auto& g : geometries) {
        values.push_back(getter(static_cast<const T&>(*g)));
    }
    return values;
}

GeometryPtr stack_cylinders(const std::vector<GeometryPtr>& geometries, const math::Dim& dim) {
    const auto& first = static_cast<const Cylinder&>(*geometries.front());
    std::optional<math::Tensor> rotation;
    bool any_rotated = std::any_of(geometries.begin(), geometries.end(), [](const GeometryPtr& g) {
        return static_cast<const Cylinder&>(*g).rotation().has_value();
    });
    if (any_rotated) {
        const math::Tensor identity = math::identity_matrix(first.vector_axes());
        rotation = math::Tensor::stack(gather<Cylinder>(geometries, [&identity](const Cylinder& c) {
            return c.rotation() ? *c.rotation() : identity;
        }), dim);
    }
    return std::make_shared<const Cylinder>(
        math::Tensor::stack(gather<Cylinder>(geometries, [](const Cylinder& c) { return c.center(); }), dim),
        math::Tensor::stack(gather<Cylinder>(geometries, [](const Cylinder& c) { return c.radius(); }), dim),
        math::Tensor::stack(gather<Cylinder>(geometries, [](const Cylinder& c) { return c.depth(); }), dim),
        rotation, first.axis());
}

GeometryPtr stack_boxes(const std::vector<GeometryPtr>& geometries, const math::Dim& dim) {
    std::optional<math::Tensor> rotation;
    bool any_rotated = std::any_of(geometries.begin(), geometries.end(), [](const GeometryPtr& g) {
        return !static_cast<const Box&>(*g).is_axis_aligned();
    });
    if (any_rotated) {
        const math::Tensor identity = math::identity_matrix(geometries.front()->vector_axes());
        rotation = math::Tensor::stack(gather<Box>(geometries, [&identity](const Box& b) {
            return b.rotation() ? *b.rotation() : identity;
        }), dim);
    }
    return std::make_shared<const Box>(
        math::Tensor::stack(gather<Box>(geometries, [](const Box& b) { return b.lower(); }), dim),
        math::Tensor::stack(gather<Box>(geometries, [](const Box& b) { return b.upper(); }), dim), rotation);
}

} // namespace

GeometryPtr stack(const std::vector<GeometryPtr>& geometries, const math::Dim& dim) {
    PFL_CHECK_ARG(!geometries.empty(), "Cannot stack an empty list of geometries");
    for (const auto& g : geometries) {
        PFL_CHECK_NOT_NULL(g, "Stacked geometry");
    }
    const GeometryType type = geometries.front()->type();
    bool uniform = std::all_of(geometries.begin(), geometries.end(),
                               [type](const GeometryPtr& g) { return g->type() == type; });
    if (uniform) {
        switch (type) {
            case GeometryType::Sphere:
                return std::make_shared<const Sphere>(
                    math::Tensor::stack(gather<Sphere>(geometries, [](const Sphere& s) { return s.center(); }), dim),
                    math::Tensor::stack(gather<Sphere>(geometries, [](const Sphere& s) { return s.radius(); }), dim));
            case GeometryType::Box:
                return stack_boxes(geometries, dim);
            case GeometryType::Point:
                return std::make_shared<const Point>(
                    math::Tensor::stack(gather<Point>(geometries, [](const Point& p) { return p.center(); }), dim));
            case GeometryType::Cylinder: {
                const std::string& axis = static_cast<const Cylinder&>(*geometries.front()).axis();
                bool same_axis = std::all_of(geometries.begin(), geometries.end(), [&axis](const GeometryPtr& g) {
                    return static_cast<const Cylinder&>(*g).axis() == axis;
                });
                if (same_axis) {
                    return stack_cylinders(geometries, dim);
                }
                break;
            }
            default:
                break;
        }
    }
    return std::make_shared<const GeometryStack>(geometries, dim);
}

} // namespace geometry
} // namespace pfl
