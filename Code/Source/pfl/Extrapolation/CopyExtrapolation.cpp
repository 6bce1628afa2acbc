/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Extrapolation/CopyExtrapolation.h"
#include "pfl/Extrapolation/Constants.h"

#include <algorithm>
#include <typeinfo>

namespace pfl {
namespace extrapolation {

namespace {

inline Index positive_mod(Index a, Index n) {
    return ((a % n) + n) % n;
}

} // namespace

bool CopyExtrapolation::equals(const Extrapolation& other) const {
    return typeid(*this) == typeid(other);
}

ExtrapolationPtr CopyExtrapolation::combine_with(const Extrapolation& other, math::BinaryOp,
                                                 bool) const {
    return equals(other) ? ptr() : nullptr;
}

math::Tensor CopyExtrapolation::pad_slab(const math::Tensor& core, const std::string& dim, bool upper,
                                         Index width, const PadCoordinates*) const {
    const Index n = core.shape().size(dim);
    std::vector<math::Tensor> cells;
    cells.reserve(static_cast<std::size_t>(width));
    for (Index k = 0; k < width; ++k) {
        Index position = upper ? n + k : k - width;
        Index i = source_index(position, n);
        cells.push_back(core.slice(math::Selection{{dim, math::Range{i, i + 1}}}));
    }
    return math::Tensor::concat(cells, dim);
}

Index ZeroGradientExtrapolation::source_index(Index position, Index n) const {
    return std::clamp<Index>(position, 0, n - 1);
}

ExtrapolationPtr ZeroGradientExtrapolation::spatial_gradient() const {
    return ZERO;
}

Index PeriodicExtrapolation::source_index(Index position, Index n) const {
    return positive_mod(position, n);
}

bool PeriodicExtrapolation::determines_boundary_values(const std::string& key) const {
    std::string dim;
    bool upper = false;
    return parse_boundary_key(key, dim, upper) && upper;
}

Index SymmetricExtrapolation::source_index(Index position, Index n) const {
    const Index period = 2 * n;
    Index m = positive_mod(position, period);
    return m < n ? m : period - 1 - m;
}

ExtrapolationPtr SymmetricExtrapolation::spatial_gradient() const {
    return ZERO;
}

Index ReflectExtrapolation::source_index(Index position, Index n) const {
    if (n == 1) {
        return 0;
    }
    const Index period = 2 * (n - 1);
    Index m = positive_mod(position, period);
    return m < n ? m : period - m;
}

ExtrapolationPtr ReflectExtrapolation::spatial_gradient() const {
    return ZERO;
}

} // namespace extrapolation
} // namespace pfl
