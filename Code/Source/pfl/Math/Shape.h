/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_MATH_SHAPE_H
#define PFL_MATH_SHAPE_H

/**
 * @file Shape.h
 * @brief Ordered set of named, kind-tagged tensor dimensions
 *
 * Shapes drive all alignment logic: tensors are broadcast against each other
 * by dimension name, never by position. Dimensions are kept in canonical
 * kind order (batch, dual, instance, spatial, channel); within a kind the
 * order of first appearance is preserved.
 */

#include "pfl/Core/Types.h"
#include <initializer_list>
#include <string>
#include <vector>

namespace pfl {
namespace math {

/**
 * @brief One named dimension
 *
 * A size of -1 marks a dimension whose size varies between the components
 * of a non-uniform tensor.
 */
struct Dim {
    std::string name;
    DimKind kind = DimKind::Spatial;
    Index size = 1;
    std::vector<std::string> item_names;

    bool operator==(const Dim& other) const {
        return name == other.name && kind == other.kind && size == other.size &&
               item_names == other.item_names;
    }
    bool operator!=(const Dim& other) const { return !(*this == other); }

    /// Position of an item name, -1 if absent
    Index item_index(const std::string& item) const;
};

/// @name Dimension factories
/// @{
Dim batch(const std::string& name, Index size);
Dim spatial(const std::string& name, Index size);
Dim instance(const std::string& name, Index size);
Dim dual(const std::string& name, Index size);
Dim dual(const std::string& name, const std::vector<std::string>& items);
Dim channel(const std::string& name, Index size);
Dim channel(const std::string& name, const std::vector<std::string>& items);
/// Channel dimension `vector` listing spatial axis names
Dim vector_dim(const std::vector<std::string>& axes);
/// @}

class Shape {
public:
    Shape() = default;
    Shape(std::initializer_list<Dim> dims);
    explicit Shape(std::vector<Dim> dims);

    const std::vector<Dim>& dims() const noexcept { return dims_; }
    std::size_t rank() const noexcept { return dims_.size(); }
    bool empty() const noexcept { return dims_.empty(); }

    bool contains(const std::string& name) const { return index_of(name) >= 0; }
    /// Position of `name`, -1 if absent
    int index_of(const std::string& name) const;
    const Dim& dim(const std::string& name) const;
    Index size(const std::string& name) const { return dim(name).size; }
    const std::vector<std::string>& item_names(const std::string& name) const { return dim(name).item_names; }
    std::vector<std::string> names() const;
    std::vector<Index> sizes() const;

    /// Product of all sizes; throws for non-uniform shapes
    Index volume() const;
    bool is_uniform() const;

    /// True if every name of `other` is present here
    bool includes(const Shape& other) const;

    Shape only(DimKind kind) const;
    Shape only(const std::vector<std::string>& names) const;
    Shape without(DimKind kind) const;
    Shape without(const std::vector<std::string>& names) const;
    Shape without(const std::string& name) const { return without(std::vector<std::string>{name}); }

    Shape batch() const { return only(DimKind::Batch); }
    Shape dual() const { return only(DimKind::Dual); }
    Shape instance() const { return only(DimKind::Instance); }
    Shape spatial() const { return only(DimKind::Spatial); }
    Shape channel() const { return only(DimKind::Channel); }
    Shape non_batch() const { return without(DimKind::Batch); }
    Shape non_channel() const { return without(DimKind::Channel); }
    Shape non_dual() const { return without(DimKind::Dual); }
    Shape non_spatial() const { return without(DimKind::Spatial); }

    /**
     * @brief Named broadcast of two shapes
     *
     * Dimensions with equal names must have equal sizes unless one of them
     * is 1. Throws ShapeMismatchException otherwise.
     */
    Shape merged(const Shape& other) const;
    /// Like merged() but returns false instead of throwing
    bool try_merge(const Shape& other, Shape& result) const;

    /// Replace an existing dimension or insert a new one
    Shape with_dim(const Dim& dim) const;
    Shape with_size(const std::string& name, Index size) const;
    Shape renamed(const std::string& name, const std::string& new_name) const;

    bool operator==(const Shape& other) const { return dims_ == other.dims_; }
    bool operator!=(const Shape& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    void canonicalize();

    std::vector<Dim> dims_;
};

inline Shape operator&(const Shape& a, const Shape& b) { return a.merged(b); }

/// Spatial shape from (name, size) pairs in the given order
Shape spatial_shape(const std::vector<std::pair<std::string, Index>>& sizes);

} // namespace math
} // namespace pfl

#endif // PFL_MATH_SHAPE_H
