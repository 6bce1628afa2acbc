/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Field/BoundDim.h"
#include "pfl/Core/PFLException.h"

#include <utility>

namespace pfl {
namespace field {

BoundDim::BoundDim(Field field, std::string name) : field_(std::move(field)), name_(std::move(name)) {}

bool BoundDim::exists() const {
    return field_.shape().contains(name_);
}

Index BoundDim::size() const {
    return field_.shape().size(name_);
}

DimKind BoundDim::kind() const {
    return field_.shape().dim(name_).kind;
}

std::vector<std::string> BoundDim::item_names() const {
    return field_.shape().item_names(name_);
}

Field BoundDim::at(Index index) const {
    const Index n = size();
    const Index i = math::wrap_index(index, n);
    PFL_THROW_IF(i < 0 || i >= n, OutOfRangeException,
                 "Index " + std::to_string(index) + " out of range for '" + name_ + "' of size " + std::to_string(n));
    const auto& items = item_names();
    if (!items.empty()) {
        return field_.slice(math::Selection{{name_, items[static_cast<std::size_t>(i)]}});
    }
    return field_.slice(math::Selection{{name_, i}});
}

Field BoundDim::at(const std::string& item) const {
    return field_.slice(math::Selection{{name_, item}});
}

std::vector<Field> BoundDim::unstack() const {
    std::vector<Field> fields;
    for (Index i = 0; i < size(); ++i) {
        fields.push_back(at(i));
    }
    return fields;
}

} // namespace field
} // namespace pfl
