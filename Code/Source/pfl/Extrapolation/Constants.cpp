/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Extrapolation/Constants.h"

namespace pfl {
namespace extrapolation {

ExtrapolationPtr as_extrapolation(Real value) {
    return constant(value);
}

ExtrapolationPtr as_extrapolation(const std::map<std::string, ExtrapolationPtr>& per_dim) {
    std::map<std::string, MixedExtrapolation::Sides> rules;
    for (const auto& [dim, e] : per_dim) {
        rules[dim] = MixedExtrapolation::Sides{e, e};
    }
    return mixed(std::move(rules));
}

ExtrapolationPtr as_extrapolation(const std::map<std::string, MixedExtrapolation::Sides>& per_side) {
    return mixed(per_side);
}

} // namespace extrapolation
} // namespace pfl
