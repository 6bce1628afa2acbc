/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_MATH_SELECTION_H
#define PFL_MATH_SELECTION_H

/**
 * @file Selection.h
 * @brief Named slicing of tensors, fields and boundary rules
 */

#include "pfl/Core/Types.h"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pfl {
namespace math {

/**
 * @brief Half-open index range; negative bounds count from the end
 */
struct Range {
    std::optional<Index> start;
    std::optional<Index> stop;
};

inline Range range(Index start, Index stop) { return Range{start, stop}; }
inline Range range_from(Index start) { return Range{start, std::nullopt}; }
inline Range range_to(Index stop) { return Range{std::nullopt, stop}; }

/// Index, range, item name or item-name list
using SliceItem = std::variant<Index, Range, std::string, std::vector<std::string>>;

/**
 * @brief Per-dimension slicing
 *
 * Entries naming dimensions that an object does not have are ignored.
 */
using Selection = std::map<std::string, SliceItem>;

/// Resolve a possibly negative index against a dimension of `size`
inline Index wrap_index(Index index, Index size) {
    return index < 0 ? index + size : index;
}

} // namespace math
} // namespace pfl

#endif // PFL_MATH_SELECTION_H
