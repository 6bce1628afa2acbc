/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_FIELD_BOUNDDIM_H
#define PFL_FIELD_BOUNDDIM_H

/**
 * @file BoundDim.h
 * @brief Named dimension of a Field
 */

#include "pfl/Field/Field.h"

#include <string>
#include <vector>

namespace pfl {
namespace field {

/**
 * @brief A dimension name bound to a field, for inspection and slicing
 *
 * The dimension is looked up in Field::shape(), so `vector` of a staggered
 * grid field refers to its face components.
 */
class BoundDim {
public:
    BoundDim(Field field, std::string name);

    const std::string& name() const noexcept { return name_; }
    bool exists() const;

    /// @throws OutOfRangeException if the dimension does not exist
    Index size() const;
    DimKind kind() const;
    bool is_batch() const { return exists() && kind() == DimKind::Batch; }
    bool is_dual() const { return exists() && kind() == DimKind::Dual; }
    bool is_instance() const { return exists() && kind() == DimKind::Instance; }
    bool is_spatial() const { return exists() && kind() == DimKind::Spatial; }
    bool is_channel() const { return exists() && kind() == DimKind::Channel; }
    std::vector<std::string> item_names() const;

    Field at(Index index) const;
    Field at(const std::string& item) const;
    Field operator[](Index index) const { return at(index); }
    Field operator[](const std::string& item) const { return at(item); }

    /// One field per index, the dimension removed
    std::vector<Field> unstack() const;

private:
    Field field_;
    std::string name_;
};

} // namespace field
} // namespace pfl

#endif // PFL_FIELD_BOUNDDIM_H
