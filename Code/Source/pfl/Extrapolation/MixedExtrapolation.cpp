/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Extrapolation/MixedExtrapolation.h"
#include "pfl/Extrapolation/Constants.h"
#include "pfl/Core/PFLException.h"

#include <set>
#include <sstream>

namespace pfl {
namespace extrapolation {

using math::BinaryOp;

MixedExtrapolation::MixedExtrapolation(std::map<std::string, Sides> rules)
    : rules_(std::move(rules)) {
    PFL_CHECK_ARG(!rules_.empty(), "Mixed extrapolation needs at least one entry");
    for (const auto& [key, s] : rules_) {
        PFL_CHECK_NOT_NULL(s.first, "lower extrapolation of '" + key + "'");
        PFL_CHECK_NOT_NULL(s.second, "upper extrapolation of '" + key + "'");
    }
}

ExtrapolationPtr mixed(std::map<std::string, MixedExtrapolation::Sides> rules) {
    PFL_CHECK_ARG(!rules.empty(), "Mixed extrapolation needs at least one entry");
    const ExtrapolationPtr& first = rules.begin()->second.first;
    bool uniform = true;
    for (const auto& [key, s] : rules) {
        PFL_CHECK_NOT_NULL(s.first, "lower extrapolation of '" + key + "'");
        PFL_CHECK_NOT_NULL(s.second, "upper extrapolation of '" + key + "'");
        uniform = uniform && same(s.first, first) && same(s.second, first);
    }
    if (uniform) {
        return first;
    }
    return std::make_shared<const MixedExtrapolation>(std::move(rules));
}

const MixedExtrapolation::Sides& MixedExtrapolation::sides(const std::string& key) const {
    auto it = rules_.find(key);
    PFL_THROW_IF(it == rules_.end(), InvalidArgumentException,
                 "No extrapolation specified for '" + key + "' in " + to_string());
    return it->second;
}

template<typename Fn>
ExtrapolationPtr MixedExtrapolation::map_rules(Fn&& fn) const {
    std::map<std::string, Sides> out;
    for (const auto& [key, s] : rules_) {
        out[key] = Sides{fn(s.first), fn(s.second)};
    }
    return mixed(std::move(out));
}

std::string MixedExtrapolation::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, s] : rules_) {
        oss << (first ? "" : ", ") << key << ": ";
        if (same(s.first, s.second)) {
            oss << s.first->to_string();
        } else {
            oss << "(" << s.first->to_string() << ", " << s.second->to_string() << ")";
        }
        first = false;
    }
    oss << "}";
    return oss.str();
}

bool MixedExtrapolation::equals(const Extrapolation& other) const {
    const auto* m = dynamic_cast<const MixedExtrapolation*>(&other);
    if (m == nullptr || m->rules_.size() != rules_.size()) {
        return false;
    }
    for (const auto& [key, s] : rules_) {
        auto it = m->rules_.find(key);
        if (it == m->rules_.end() || !same(s.first, it->second.first) || !same(s.second, it->second.second)) {
            return false;
        }
    }
    return true;
}

bool MixedExtrapolation::determines_boundary_values(const std::string& key) const {
    std::string dim;
    bool upper = false;
    if (rules_.count(key) > 0) {
        return rules_.at(key).first->determines_boundary_values(key);
    }
    PFL_THROW_IF(!parse_boundary_key(key, dim, upper), InvalidArgumentException,
                 "No extrapolation specified for boundary '" + key + "' in " + to_string());
    return on_side(dim, upper)->determines_boundary_values(key);
}

ExtrapolationPtr MixedExtrapolation::on_side(const std::string& dim, bool upper) const {
    const Sides& s = sides(dim);
    return upper ? s.second : s.first;
}

ExtrapolationPtr MixedExtrapolation::component(const std::string& item) const {
    return map_rules([&](const ExtrapolationPtr& e) { return e->component(item); });
}

ExtrapolationPtr MixedExtrapolation::slice(const math::Selection& selection) const {
    return map_rules([&](const ExtrapolationPtr& e) { return e->slice(selection); });
}

ExtrapolationPtr MixedExtrapolation::spatial_gradient() const {
    return map_rules([](const ExtrapolationPtr& e) { return e->spatial_gradient(); });
}

ExtrapolationPtr MixedExtrapolation::transform(math::UnaryOp op) const {
    return map_rules([op](const ExtrapolationPtr& e) { return e->transform(op); });
}

ExtrapolationPtr MixedExtrapolation::combine_with(const Extrapolation& other, BinaryOp op,
                                                  bool this_is_left) const {
    ExtrapolationPtr identity;
    switch (op) {
        case BinaryOp::Add:
        case BinaryOp::Sub:
            identity = ZERO;
            break;
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Pow:
            identity = ONE;
            break;
        default:
            break;
    }
    const auto* other_mixed = dynamic_cast<const MixedExtrapolation*>(&other);
    std::set<std::string> keys;
    for (const auto& entry : rules_) {
        keys.insert(entry.first);
    }
    if (other_mixed != nullptr) {
        for (const auto& entry : other_mixed->rules_) {
            keys.insert(entry.first);
        }
    }
    auto side_of = [&](const Extrapolation& e, const std::string& key, bool upper) -> ExtrapolationPtr {
        const auto* m = dynamic_cast<const MixedExtrapolation*>(&e);
        if (m == nullptr) {
            return e.ptr();
        }
        auto it = m->rules_.find(key);
        if (it != m->rules_.end()) {
            return upper ? it->second.second : it->second.first;
        }
        PFL_THROW_IF(identity == nullptr, IncompatibleExtrapolations,
                     "Boundary '" + key + "' is only specified on one side of " + math::to_string(op));
        return identity;
    };
    std::map<std::string, Sides> out;
    for (const auto& key : keys) {
        ExtrapolationPtr result[2];
        for (int upper = 0; upper < 2; ++upper) {
            ExtrapolationPtr mine = side_of(*this, key, upper != 0);
            ExtrapolationPtr theirs = side_of(other, key, upper != 0);
            result[upper] = this_is_left ? combine(mine, theirs, op) : combine(theirs, mine, op);
        }
        out[key] = Sides{result[0], result[1]};
    }
    return mixed(std::move(out));
}

math::Tensor MixedExtrapolation::pad_slab(const math::Tensor& core, const std::string& dim, bool upper,
                                          Index width, const PadCoordinates* coords) const {
    return on_side(dim, upper)->pad_slab(core, dim, upper, width, coords);
}

} // namespace extrapolation
} // namespace pfl
