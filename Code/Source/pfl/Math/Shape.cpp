/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Math/Shape.h"
#include "pfl/Core/PFLException.h"

#include <algorithm>
#include <sstream>

namespace pfl {
namespace math {

Index Dim::item_index(const std::string& item) const {
    for (std::size_t i = 0; i < item_names.size(); ++i) {
        if (item_names[i] == item) {
            return static_cast<Index>(i);
        }
    }
    return -1;
}

Dim batch(const std::string& name, Index size) {
    return Dim{name, DimKind::Batch, size, {}};
}

Dim spatial(const std::string& name, Index size) {
    return Dim{name, DimKind::Spatial, size, {}};
}

Dim instance(const std::string& name, Index size) {
    return Dim{name, DimKind::Instance, size, {}};
}

Dim dual(const std::string& name, Index size) {
    std::string full = (!name.empty() && name[0] == '~') ? name : "~" + name;
    return Dim{full, DimKind::Dual, size, {}};
}

Dim dual(const std::string& name, const std::vector<std::string>& items) {
    Dim d = dual(name, static_cast<Index>(items.size()));
    d.item_names = items;
    return d;
}

Dim channel(const std::string& name, Index size) {
    return Dim{name, DimKind::Channel, size, {}};
}

Dim channel(const std::string& name, const std::vector<std::string>& items) {
    return Dim{name, DimKind::Channel, static_cast<Index>(items.size()), items};
}

Dim vector_dim(const std::vector<std::string>& axes) {
    return channel(dims::VECTOR, axes);
}

// ---------------------------------------------------------------------------
// Shape
// ---------------------------------------------------------------------------

Shape::Shape(std::initializer_list<Dim> dims)
    : dims_(dims) {
    canonicalize();
}

Shape::Shape(std::vector<Dim> dims)
    : dims_(std::move(dims)) {
    canonicalize();
}

void Shape::canonicalize() {
    for (std::size_t i = 0; i < dims_.size(); ++i) {
        PFL_CHECK_ARG(!dims_[i].name.empty(), "Dimension names must not be empty");
        for (std::size_t j = i + 1; j < dims_.size(); ++j) {
            PFL_CHECK_ARG(dims_[i].name != dims_[j].name,
                          "Duplicate dimension '" + dims_[i].name + "'");
        }
        PFL_CHECK_ARG(dims_[i].item_names.empty() ||
                      static_cast<Index>(dims_[i].item_names.size()) == dims_[i].size,
                      "Item names of '" + dims_[i].name + "' do not match its size");
    }
    std::stable_sort(dims_.begin(), dims_.end(), [](const Dim& a, const Dim& b) {
        return static_cast<int>(a.kind) < static_cast<int>(b.kind);
    });
}

int Shape::index_of(const std::string& name) const {
    for (std::size_t i = 0; i < dims_.size(); ++i) {
        if (dims_[i].name == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const Dim& Shape::dim(const std::string& name) const {
    int i = index_of(name);
    PFL_THROW_IF(i < 0, OutOfRangeException,
                 "Dimension '" + name + "' not in shape " + to_string());
    return dims_[static_cast<std::size_t>(i)];
}

std::vector<std::string> Shape::names() const {
    std::vector<std::string> out;
    out.reserve(dims_.size());
    for (const auto& d : dims_) {
        out.push_back(d.name);
    }
    return out;
}

std::vector<Index> Shape::sizes() const {
    std::vector<Index> out;
    out.reserve(dims_.size());
    for (const auto& d : dims_) {
        out.push_back(d.size);
    }
    return out;
}

Index Shape::volume() const {
    Index v = 1;
    for (const auto& d : dims_) {
        PFL_THROW_IF(d.size < 0, ShapeMismatchException,
                     "Volume of non-uniform shape " + to_string() + " is undefined");
        v *= d.size;
    }
    return v;
}

bool Shape::is_uniform() const {
    return std::none_of(dims_.begin(), dims_.end(), [](const Dim& d) { return d.size < 0; });
}

bool Shape::includes(const Shape& other) const {
    for (const auto& d : other.dims_) {
        if (!contains(d.name)) {
            return false;
        }
    }
    return true;
}

Shape Shape::only(DimKind kind) const {
    Shape out;
    for (const auto& d : dims_) {
        if (d.kind == kind) {
            out.dims_.push_back(d);
        }
    }
    return out;
}

Shape Shape::only(const std::vector<std::string>& names) const {
    Shape out;
    for (const auto& d : dims_) {
        if (std::find(names.begin(), names.end(), d.name) != names.end()) {
            out.dims_.push_back(d);
        }
    }
    return out;
}

Shape Shape::without(DimKind kind) const {
    Shape out;
    for (const auto& d : dims_) {
        if (d.kind != kind) {
            out.dims_.push_back(d);
        }
    }
    return out;
}

Shape Shape::without(const std::vector<std::string>& names) const {
    Shape out;
    for (const auto& d : dims_) {
        if (std::find(names.begin(), names.end(), d.name) == names.end()) {
            out.dims_.push_back(d);
        }
    }
    return out;
}

bool Shape::try_merge(const Shape& other, Shape& result) const {
    std::vector<Dim> merged = dims_;
    for (const auto& d : other.dims_) {
        int i = index_of(d.name);
        if (i < 0) {
            merged.push_back(d);
            continue;
        }
        Dim& mine = merged[static_cast<std::size_t>(i)];
        if (mine.kind != d.kind) {
            return false;
        }
        if (mine.size == d.size) {
            if (mine.item_names.empty()) {
                mine.item_names = d.item_names;
            }
        } else if (mine.size == 1) {
            mine = d;
        } else if (d.size != 1) {
            return false;
        }
    }
    result = Shape(std::move(merged));
    return true;
}

Shape Shape::merged(const Shape& other) const {
    Shape result;
    PFL_THROW_IF(!try_merge(other, result), ShapeMismatchException,
                 "Cannot broadcast shapes " + to_string() + " and " + other.to_string());
    return result;
}

Shape Shape::with_dim(const Dim& dim) const {
    std::vector<Dim> out = dims_;
    int i = index_of(dim.name);
    if (i < 0) {
        out.push_back(dim);
    } else {
        out[static_cast<std::size_t>(i)] = dim;
    }
    return Shape(std::move(out));
}

Shape Shape::with_size(const std::string& name, Index size) const {
    Dim d = dim(name);
    if (d.size != size) {
        d.item_names.clear();
    }
    d.size = size;
    return with_dim(d);
}

Shape Shape::renamed(const std::string& name, const std::string& new_name) const {
    std::vector<Dim> out = dims_;
    int i = index_of(name);
    PFL_THROW_IF(i < 0, OutOfRangeException, "Cannot rename missing dimension '" + name + "'");
    Dim& d = out[static_cast<std::size_t>(i)];
    d.name = new_name;
    if (!new_name.empty() && new_name[0] == '~') {
        d.kind = DimKind::Dual;
    } else if (d.kind == DimKind::Dual) {
        d.kind = DimKind::Channel;
    }
    return Shape(std::move(out));
}

std::string Shape::to_string() const {
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < dims_.size(); ++i) {
        const Dim& d = dims_[i];
        if (i > 0) {
            oss << ", ";
        }
        oss << d.name << dim_kind_to_string(d.kind)[0] << "=";
        if (!d.item_names.empty()) {
            for (std::size_t k = 0; k < d.item_names.size(); ++k) {
                oss << (k > 0 ? "," : "") << d.item_names[k];
            }
        } else {
            oss << d.size;
        }
    }
    oss << ")";
    return oss.str();
}

Shape spatial_shape(const std::vector<std::pair<std::string, Index>>& sizes) {
    std::vector<Dim> out;
    out.reserve(sizes.size());
    for (const auto& [name, size] : sizes) {
        out.push_back(spatial(name, size));
    }
    return Shape(std::move(out));
}

} // namespace math
} // namespace pfl
