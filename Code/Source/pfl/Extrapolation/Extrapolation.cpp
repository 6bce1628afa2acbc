/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Extrapolation/Extrapolation.h"
#include "pfl/Core/PFLException.h"

namespace pfl {
namespace extrapolation {

using math::Tensor;

Real PadCoordinates::coordinate(const std::string& dim, Index i) const {
    auto it = axes.find(dim);
    PFL_THROW_IF(it == axes.end(), InvalidArgumentException, "No pad coordinates for dimension '" + dim + "'");
    return it->second.first + static_cast<Real>(i) * it->second.second;
}

void PadCoordinates::grow_lower(const std::string& dim, Index lower) {
    auto it = axes.find(dim);
    if (it != axes.end()) {
        it->second.first -= static_cast<Real>(lower) * it->second.second;
    }
}

std::string boundary_key(const std::string& dim, bool upper) {
    return dim + (upper ? "+" : "-");
}

bool parse_boundary_key(const std::string& key, std::string& dim, bool& upper) {
    if (key.size() < 2) {
        return false;
    }
    char sign = key.back();
    if (sign != '-' && sign != '+') {
        return false;
    }
    dim = key.substr(0, key.size() - 1);
    upper = sign == '+';
    return true;
}

// ---------------------------------------------------------------------------
// Extrapolation
// ---------------------------------------------------------------------------

std::pair<bool, bool> Extrapolation::valid_outer_faces(const std::string& dim) const {
    return {!determines_boundary_values(boundary_key(dim, false)),
            !determines_boundary_values(boundary_key(dim, true))};
}

ExtrapolationPtr Extrapolation::on_side(const std::string&, bool) const {
    return ptr();
}

ExtrapolationPtr Extrapolation::component(const std::string&) const {
    return ptr();
}

ExtrapolationPtr Extrapolation::slice(const math::Selection&) const {
    return ptr();
}

Tensor Extrapolation::pad(const Tensor& value, const PadWidths& widths, PadCoordinates* coords) const {
    Tensor result = value;
    for (const auto& [dim, w] : widths) {
        PFL_CHECK_ARG(w.first >= 0 && w.second >= 0, "Pad widths must be non-negative");
        if (!result.shape().contains(dim) || (w.first == 0 && w.second == 0)) {
            continue;
        }
        result = pad_dim(result, dim, w.first, w.second, coords);
        if (coords != nullptr) {
            coords->grow_lower(dim, w.first);
        }
    }
    return result;
}

Tensor Extrapolation::pad_dim(const Tensor& value, const std::string& dim, Index lower, Index upper,
                              const PadCoordinates* coords) const {
    if (!value.is_uniform()) {
        std::vector<Tensor> comps;
        for (const auto& c : value.components()) {
            comps.push_back(c.shape().contains(dim) ? pad_dim(c, dim, lower, upper, coords) : c);
        }
        return Tensor::stack(comps, value.shape().dim(value.stack_dim()));
    }
    // Pad a representative slice; collapsed dimensions are restored afterwards.
    // Position-dependent padding needs every position.
    math::Selection squeeze;
    for (const auto& d : value.shape().dims()) {
        if (coords == nullptr && d.name != dim && value.is_collapsed(d.name)) {
            squeeze[d.name] = math::Range{0, 1};
        }
    }
    Tensor core = value.slice(squeeze);
    const Index n = core.shape().size(dim);
    const Index padded_size = n + lower + upper;
    math::Shape out_shape = value.shape().with_size(dim, padded_size);
    PFL_CHECK_ARG(n > 0, "Cannot pad empty dimension '" + dim + "'");

    ExtrapolationPtr low = on_side(dim, false);
    ExtrapolationPtr high = on_side(dim, true);
    if (value.is_collapsed(dim) && low->copies_values() && high->copies_values()) {
        return core.slice(math::Selection{{dim, math::Range{0, 1}}}).expand(out_shape);
    }
    std::vector<Tensor> parts;
    if (lower > 0) {
        parts.push_back(low->pad_slab(core, dim, false, lower, coords));
    }
    parts.push_back(core);
    if (upper > 0) {
        parts.push_back(high->pad_slab(core, dim, true, upper, coords));
    }
    return Tensor::concat(parts, dim).expand(out_shape);
}

// ---------------------------------------------------------------------------
// Algebra
// ---------------------------------------------------------------------------

bool same(const ExtrapolationPtr& a, const ExtrapolationPtr& b) {
    if (a == nullptr || b == nullptr) {
        return a == b;
    }
    return a->equals(*b);
}

ExtrapolationPtr combine(const ExtrapolationPtr& a, const ExtrapolationPtr& b, math::BinaryOp op) {
    PFL_CHECK_NOT_NULL(a, "left extrapolation");
    PFL_CHECK_NOT_NULL(b, "right extrapolation");
    ExtrapolationPtr result = a->combine_with(*b, op, true);
    if (result == nullptr) {
        result = b->combine_with(*a, op, false);
    }
    PFL_THROW_IF(result == nullptr, IncompatibleExtrapolations,
                 "Cannot combine " + a->to_string() + " " + math::to_string(op) + " " + b->to_string());
    return result;
}

ExtrapolationPtr transform(const ExtrapolationPtr& e, math::UnaryOp op) {
    PFL_CHECK_NOT_NULL(e, "extrapolation");
    return e->transform(op);
}

Tensor pad(const Tensor& value, const PadWidths& widths, const ExtrapolationPtr& extrapolation,
           PadCoordinates* coords) {
    PFL_CHECK_NOT_NULL(extrapolation, "extrapolation");
    return extrapolation->pad(value, widths, coords);
}

} // namespace extrapolation
} // namespace pfl
