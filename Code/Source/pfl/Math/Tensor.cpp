/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#include "pfl/Math/Tensor.h"
#include "pfl/Core/PFLException.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <set>
#include <sstream>

namespace pfl {
namespace math {

namespace {

template<typename Fn>
void for_each_index(const std::vector<Index>& sizes, Fn&& fn) {
    Index total = 1;
    for (Index s : sizes) {
        total *= s;
    }
    if (total <= 0) {
        return;
    }
    std::vector<Index> idx(sizes.size(), 0);
    for (Index k = 0; k < total; ++k) {
        fn(idx, k);
        for (int d = static_cast<int>(sizes.size()) - 1; d >= 0; --d) {
            if (++idx[static_cast<std::size_t>(d)] < sizes[static_cast<std::size_t>(d)]) {
                break;
            }
            idx[static_cast<std::size_t>(d)] = 0;
        }
    }
}

inline Index linear(const std::vector<Index>& idx, const std::vector<Index>& strides, Index offset) {
    Index pos = offset;
    for (std::size_t i = 0; i < idx.size(); ++i) {
        pos += idx[i] * strides[i];
    }
    return pos;
}

std::vector<Index> row_major_strides(const std::vector<Index>& sizes) {
    std::vector<Index> strides(sizes.size(), 1);
    for (int i = static_cast<int>(sizes.size()) - 2; i >= 0; --i) {
        strides[static_cast<std::size_t>(i)] =
            strides[static_cast<std::size_t>(i) + 1] * sizes[static_cast<std::size_t>(i) + 1];
    }
    return strides;
}

/// Shape of a non-uniform stack; sizes that differ between components become -1
Shape stacked_shape(const std::vector<Tensor>& comps, const Dim& stack_dim) {
    std::vector<Dim> dims;
    for (const auto& c : comps) {
        for (const auto& d : c.shape().dims()) {
            auto it = std::find_if(dims.begin(), dims.end(),
                                   [&](const Dim& e) { return e.name == d.name; });
            if (it == dims.end()) {
                dims.push_back(d);
            } else if (it->size != d.size) {
                it->size = -1;
                it->item_names.clear();
            }
        }
    }
    dims.push_back(stack_dim);
    return Shape(std::move(dims));
}

} // namespace

// ============================================================================
// Element-wise operators
// ============================================================================

const char* to_string(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:          return "+";
        case BinaryOp::Sub:          return "-";
        case BinaryOp::Mul:          return "*";
        case BinaryOp::Div:          return "/";
        case BinaryOp::Pow:          return "**";
        case BinaryOp::Min:          return "min";
        case BinaryOp::Max:          return "max";
        case BinaryOp::Greater:      return ">";
        case BinaryOp::GreaterEqual: return ">=";
        case BinaryOp::Less:         return "<";
        case BinaryOp::LessEqual:    return "<=";
        case BinaryOp::And:          return "&";
        case BinaryOp::Or:           return "|";
        default:                     return "?";
    }
}

const char* to_string(UnaryOp op) {
    switch (op) {
        case UnaryOp::Neg:  return "neg";
        case UnaryOp::Abs:  return "abs";
        case UnaryOp::Sqrt: return "sqrt";
        case UnaryOp::Exp:  return "exp";
        case UnaryOp::Log:  return "log";
        case UnaryOp::Sin:  return "sin";
        case UnaryOp::Cos:  return "cos";
        case UnaryOp::Sign: return "sign";
        case UnaryOp::Not:  return "not";
        default:            return "?";
    }
}

Real apply(BinaryOp op, Real a, Real b) {
    switch (op) {
        case BinaryOp::Add:          return a + b;
        case BinaryOp::Sub:          return a - b;
        case BinaryOp::Mul:          return a * b;
        case BinaryOp::Div:          return a / b;
        case BinaryOp::Pow:          return std::pow(a, b);
        case BinaryOp::Min:          return std::min(a, b);
        case BinaryOp::Max:          return std::max(a, b);
        case BinaryOp::Greater:      return a > b ? Real(1) : Real(0);
        case BinaryOp::GreaterEqual: return a >= b ? Real(1) : Real(0);
        case BinaryOp::Less:         return a < b ? Real(1) : Real(0);
        case BinaryOp::LessEqual:    return a <= b ? Real(1) : Real(0);
        case BinaryOp::And:          return (a != 0 && b != 0) ? Real(1) : Real(0);
        case BinaryOp::Or:           return (a != 0 || b != 0) ? Real(1) : Real(0);
    }
    PFL_THROW(InvalidArgumentException, "Unknown binary operator");
}

Real apply(UnaryOp op, Real a) {
    switch (op) {
        case UnaryOp::Neg:  return -a;
        case UnaryOp::Abs:  return std::abs(a);
        case UnaryOp::Sqrt: return std::sqrt(a);
        case UnaryOp::Exp:  return std::exp(a);
        case UnaryOp::Log:  return std::log(a);
        case UnaryOp::Sin:  return std::sin(a);
        case UnaryOp::Cos:  return std::cos(a);
        case UnaryOp::Sign: return a > 0 ? Real(1) : (a < 0 ? Real(-1) : Real(0));
        case UnaryOp::Not:  return a == 0 ? Real(1) : Real(0);
    }
    PFL_THROW(InvalidArgumentException, "Unknown unary operator");
}

// ============================================================================
// Construction
// ============================================================================

Tensor::Tensor()
    : Tensor(Real(0)) {}

Tensor::Tensor(Real value)
    : data_(std::make_shared<const Eigen::ArrayXd>(Eigen::ArrayXd::Constant(1, value))) {}

Tensor::Tensor(const Shape& shape, Eigen::ArrayXd data)
    : shape_(shape) {
    PFL_CHECK_SHAPE(shape.is_uniform(), "Dense tensors require a uniform shape, got " + shape.to_string());
    PFL_CHECK_SHAPE(data.size() == shape.volume(),
                    "Data size " + std::to_string(data.size()) + " does not match shape " + shape.to_string());
    strides_ = row_major_strides(shape.sizes());
    data_ = std::make_shared<const Eigen::ArrayXd>(std::move(data));
}

Tensor Tensor::make_view(Shape shape, std::shared_ptr<const Eigen::ArrayXd> data,
                         std::vector<Index> strides, Index offset) {
    Tensor t;
    t.shape_ = std::move(shape);
    t.data_ = std::move(data);
    t.strides_ = std::move(strides);
    t.offset_ = offset;
    return t;
}

Tensor Tensor::make_stack(const Shape& shape, const std::string& stack_dim, std::vector<Tensor> components) {
    Tensor t;
    t.shape_ = shape;
    t.data_.reset();
    t.strides_.clear();
    t.stack_dim_ = stack_dim;
    t.components_ = std::make_shared<const std::vector<Tensor>>(std::move(components));
    return t;
}

Tensor Tensor::full(const Shape& shape, Real value) {
    PFL_CHECK_SHAPE(shape.is_uniform(), "Cannot fill non-uniform shape " + shape.to_string());
    return make_view(shape, std::make_shared<const Eigen::ArrayXd>(Eigen::ArrayXd::Constant(1, value)),
                     std::vector<Index>(shape.rank(), 0), 0);
}

Tensor Tensor::from_values(const Shape& shape, const std::vector<Real>& values) {
    Eigen::ArrayXd data = Eigen::Map<const Eigen::ArrayXd>(values.data(), static_cast<Eigen::Index>(values.size()));
    return Tensor(shape, std::move(data));
}

Tensor Tensor::vector(const std::vector<std::string>& axes, const std::vector<Real>& values) {
    PFL_CHECK_ARG(axes.size() == values.size(), "Vector needs one value per axis");
    return from_values(Shape{vector_dim(axes)}, values);
}

Tensor Tensor::linspace(Real start, Real stop, const Dim& dim) {
    Eigen::ArrayXd data;
    if (dim.size > 1) {
        data = Eigen::ArrayXd::LinSpaced(static_cast<Eigen::Index>(dim.size), start, stop);
    } else {
        data = Eigen::ArrayXd::Constant(std::max<Index>(dim.size, 0), start);
    }
    return Tensor(Shape{dim}, std::move(data));
}

Tensor Tensor::arange(const Dim& dim) {
    return linspace(Real(0), static_cast<Real>(dim.size - 1), dim);
}

namespace {

/// Write `block` into row-major `out` at `dim_offset` along `dim`
void write_block(Eigen::ArrayXd& out, const Shape& out_shape, const Tensor& block,
                 const std::string& dim, Index block_size, Index dim_offset) {
    Shape block_shape = out_shape.with_size(dim, block_size);
    Tensor b = block.expand(block_shape);
    std::vector<std::string> order = block_shape.names();
    Eigen::ArrayXd values = b.to_array(order);
    std::vector<Index> out_strides = row_major_strides(out_shape.sizes());
    int dim_pos = out_shape.index_of(dim);
    for_each_index(block_shape.sizes(), [&](const std::vector<Index>& idx, Index k) {
        Index pos = 0;
        for (std::size_t i = 0; i < idx.size(); ++i) {
            Index j = idx[i] + (static_cast<int>(i) == dim_pos ? dim_offset : 0);
            pos += j * out_strides[i];
        }
        out[pos] = values[k];
    });
}

} // namespace

Tensor Tensor::stack(const std::vector<Tensor>& values, const Dim& dim) {
    PFL_CHECK_ARG(!values.empty(), "Cannot stack an empty list of tensors");
    Dim d = dim;
    d.size = static_cast<Index>(values.size());
    PFL_CHECK_ARG(d.item_names.empty() || static_cast<Index>(d.item_names.size()) == d.size,
                  "Stack dimension '" + d.name + "' item names do not match the number of values");
    bool uniform = true;
    bool compatible = true;
    Shape merged;
    for (const auto& v : values) {
        PFL_THROW_IF(v.shape().contains(d.name), ShapeMismatchException,
                     "Cannot stack along existing dimension '" + d.name + "'");
        uniform = uniform && v.is_uniform();
        compatible = compatible && merged.try_merge(v.shape(), merged);
    }
    PFL_THROW_IF(!uniform, NotImplementedException, "stacking non-uniform tensors");
    if (!compatible) {
        return make_stack(stacked_shape(values, d), d.name, values);
    }
    Shape out_shape = merged.with_dim(d);
    Eigen::ArrayXd data(out_shape.volume());
    for (std::size_t i = 0; i < values.size(); ++i) {
        write_block(data, out_shape, values[i], d.name, 1, static_cast<Index>(i));
    }
    return Tensor(out_shape, std::move(data));
}

Tensor Tensor::concat(const std::vector<Tensor>& values, const std::string& dim) {
    PFL_CHECK_ARG(!values.empty(), "Cannot concatenate an empty list of tensors");
    if (values.size() == 1) {
        return values.front();
    }
    bool any_stacked = std::any_of(values.begin(), values.end(),
                                   [](const Tensor& t) { return !t.is_uniform(); });
    if (any_stacked) {
        const Tensor& first = values.front();
        PFL_THROW_IF(first.is_uniform(), ShapeMismatchException,
                     "Cannot concatenate uniform and non-uniform tensors");
        const std::string& s = first.stack_dim();
        std::vector<Tensor> comps;
        if (dim == s) {
            std::vector<std::string> items;
            for (const auto& v : values) {
                PFL_CHECK_SHAPE(!v.is_uniform() && v.stack_dim() == s, "Mismatching stack dimensions");
                const auto& vi = v.shape().item_names(s);
                items.insert(items.end(), vi.begin(), vi.end());
                comps.insert(comps.end(), v.components().begin(), v.components().end());
            }
            Dim sd = first.shape().dim(s);
            sd.size = static_cast<Index>(comps.size());
            sd.item_names = (static_cast<Index>(items.size()) == sd.size) ? items : std::vector<std::string>{};
            return stack(comps, sd);
        }
        for (std::size_t i = 0; i < first.components().size(); ++i) {
            std::vector<Tensor> parts;
            for (const auto& v : values) {
                parts.push_back(v.component(static_cast<Index>(i), s));
            }
            comps.push_back(concat(parts, dim));
        }
        return stack(comps, first.shape().dim(s));
    }

    Shape others;
    Dim cat_dim;
    Index total = 0;
    std::vector<std::string> items;
    bool all_items = true;
    for (std::size_t i = 0; i < values.size(); ++i) {
        const Shape& s = values[i].shape();
        PFL_THROW_IF(!s.contains(dim), ShapeMismatchException,
                     "Cannot concatenate along '" + dim + "': missing in " + s.to_string());
        const Dim& d = s.dim(dim);
        if (i == 0) {
            cat_dim = d;
        }
        total += d.size;
        all_items = all_items && !d.item_names.empty();
        items.insert(items.end(), d.item_names.begin(), d.item_names.end());
        others = others.merged(s.without(dim));
    }
    cat_dim.size = total;
    cat_dim.item_names = all_items ? items : std::vector<std::string>{};
    Shape out_shape = others.with_dim(cat_dim);
    Eigen::ArrayXd data(out_shape.volume());
    Index pos = 0;
    for (const auto& v : values) {
        Index n = v.shape().size(dim);
        write_block(data, out_shape, v, dim, n, pos);
        pos += n;
    }
    return Tensor(out_shape, std::move(data));
}

// ============================================================================
// Accessors
// ============================================================================

const std::string& Tensor::stack_dim() const {
    PFL_THROW_IF(is_uniform(), InvalidArgumentException, "Uniform tensor has no stack dimension");
    return stack_dim_;
}

const std::vector<Tensor>& Tensor::components() const {
    PFL_THROW_IF(is_uniform(), InvalidArgumentException, "Uniform tensor has no components");
    return *components_;
}

Tensor Tensor::component(Index i, const std::string& dim) const {
    if (!is_uniform() && stack_dim_ == dim) {
        const auto& comps = *components_;
        Index n = static_cast<Index>(comps.size());
        i = wrap_index(i, n);
        PFL_THROW_IF(i < 0 || i >= n, OutOfRangeException, "Component index out of range");
        return comps[static_cast<std::size_t>(i)];
    }
    if (!shape_.contains(dim)) {
        return *this;
    }
    return slice(Selection{{dim, i}});
}

Index Tensor::stride(const std::string& name) const {
    int i = shape_.index_of(name);
    PFL_THROW_IF(i < 0, OutOfRangeException, "Dimension '" + name + "' not in tensor");
    return strides_[static_cast<std::size_t>(i)];
}

bool Tensor::is_collapsed(const std::string& name) const {
    if (!shape_.contains(name)) {
        return false;
    }
    if (!is_uniform()) {
        if (name == stack_dim_) {
            return false;
        }
        return std::all_of(components_->begin(), components_->end(),
                           [&](const Tensor& c) { return !c.shape().contains(name) || c.is_collapsed(name) ||
                                                         c.shape().size(name) == 1; }) &&
               shape_.size(name) != 1;
    }
    return shape_.size(name) > 1 && stride(name) == 0;
}

Index Tensor::stored_size() const {
    if (!is_uniform()) {
        Index n = 0;
        for (const auto& c : *components_) {
            n += c.stored_size();
        }
        return n;
    }
    return static_cast<Index>(data_->size());
}

std::vector<Index> Tensor::aligned_strides(const Shape& out) const {
    std::vector<Index> result(out.rank(), 0);
    for (std::size_t i = 0; i < out.rank(); ++i) {
        const Dim& d = out.dims()[i];
        int j = shape_.index_of(d.name);
        if (j < 0) {
            continue;
        }
        Index own = shape_.dims()[static_cast<std::size_t>(j)].size;
        if (own == d.size) {
            result[i] = strides_[static_cast<std::size_t>(j)];
        } else if (own != 1) {
            PFL_THROW(ShapeMismatchException,
                      "Cannot align " + shape_.to_string() + " to " + out.to_string());
        }
    }
    return result;
}

Real Tensor::item() const {
    PFL_THROW_IF(!is_uniform() || shape_.volume() != 1, ShapeMismatchException,
                 "item() requires a single element, got " + shape_.to_string());
    return (*data_)[offset_];
}

Real Tensor::value(const std::map<std::string, Index>& index) const {
    if (!is_uniform()) {
        auto it = index.find(stack_dim_);
        PFL_THROW_IF(it == index.end(), InvalidArgumentException,
                     "Indexing a non-uniform tensor requires '" + stack_dim_ + "'");
        return component(it->second, stack_dim_).value(index);
    }
    Index pos = offset_;
    for (std::size_t i = 0; i < shape_.rank(); ++i) {
        const Dim& d = shape_.dims()[i];
        auto it = index.find(d.name);
        if (it == index.end()) {
            continue;
        }
        Index j = wrap_index(it->second, d.size);
        PFL_THROW_IF(j < 0 || j >= d.size, OutOfRangeException,
                     "Index " + std::to_string(it->second) + " out of range for '" + d.name + "'");
        pos += j * strides_[i];
    }
    return (*data_)[pos];
}

Eigen::ArrayXd Tensor::to_array(const std::vector<std::string>& order) const {
    PFL_THROW_IF(!is_uniform(), ShapeMismatchException,
                 "Cannot flatten non-uniform tensor " + shape_.to_string());
    std::vector<std::string> names = order.empty() ? shape_.names() : order;
    PFL_CHECK_SHAPE(names.size() == shape_.rank() && shape_.only(names).rank() == shape_.rank(),
                    "Order does not list the dimensions of " + shape_.to_string());
    std::vector<Index> sizes;
    std::vector<Index> strides;
    for (const auto& n : names) {
        sizes.push_back(shape_.size(n));
        strides.push_back(stride(n));
    }
    Eigen::ArrayXd out(shape_.volume());
    for_each_index(sizes, [&](const std::vector<Index>& idx, Index k) {
        out[k] = (*data_)[linear(idx, strides, offset_)];
    });
    return out;
}

std::vector<Real> Tensor::to_vector(const std::vector<std::string>& order) const {
    Eigen::ArrayXd a = to_array(order);
    return std::vector<Real>(a.data(), a.data() + a.size());
}

// ============================================================================
// Views
// ============================================================================

Tensor Tensor::slice(const Selection& selection) const {
    if (selection.empty()) {
        return *this;
    }
    if (!is_uniform()) {
        auto own = selection.find(stack_dim_);
        Selection rest = selection;
        rest.erase(stack_dim_);
        if (own == selection.end()) {
            std::vector<Tensor> comps;
            for (const auto& c : *components_) {
                comps.push_back(c.slice(rest));
            }
            return stack(comps, shape_.dim(stack_dim_));
        }
        // Resolve the stack dimension with a dense index tensor of component ids
        Tensor ids = arange(shape_.dim(stack_dim_)).with_item_names(stack_dim_, shape_.item_names(stack_dim_))
                         .slice(Selection{{stack_dim_, own->second}});
        if (!ids.shape().contains(stack_dim_)) {
            return component(static_cast<Index>(ids.item()), stack_dim_).slice(rest);
        }
        std::vector<Tensor> comps;
        for (Real id : ids.to_vector()) {
            comps.push_back(component(static_cast<Index>(id), stack_dim_).slice(rest));
        }
        return stack(comps, ids.shape().dim(stack_dim_));
    }

    std::vector<Dim> dims = shape_.dims();
    std::vector<Index> strides = strides_;
    Index offset = offset_;
    std::vector<std::pair<std::string, std::vector<std::string>>> gathers;

    for (const auto& [name, item] : selection) {
        auto it = std::find_if(dims.begin(), dims.end(), [&](const Dim& d) { return d.name == name; });
        if (it == dims.end()) {
            continue;
        }
        std::size_t pos = static_cast<std::size_t>(it - dims.begin());
        Dim& d = *it;
        std::optional<Index> index;
        if (std::holds_alternative<Index>(item)) {
            index = std::get<Index>(item);
        } else if (std::holds_alternative<std::string>(item)) {
            Index k = d.item_index(std::get<std::string>(item));
            PFL_THROW_IF(k < 0, OutOfRangeException,
                         "Item '" + std::get<std::string>(item) + "' not in dimension '" + name + "'");
            index = k;
        } else if (std::holds_alternative<Range>(item)) {
            const Range& r = std::get<Range>(item);
            Index start = std::clamp<Index>(wrap_index(r.start.value_or(0), d.size), 0, d.size);
            Index stop = std::clamp<Index>(wrap_index(r.stop.value_or(d.size), d.size), 0, d.size);
            stop = std::max(stop, start);
            offset += start * strides[pos];
            if (!d.item_names.empty()) {
                d.item_names = std::vector<std::string>(d.item_names.begin() + start, d.item_names.begin() + stop);
            }
            d.size = stop - start;
            continue;
        } else {
            gathers.emplace_back(name, std::get<std::vector<std::string>>(item));
            continue;
        }
        Index k = wrap_index(*index, d.size);
        PFL_THROW_IF(k < 0 || k >= d.size, OutOfRangeException,
                     "Index " + std::to_string(*index) + " out of range for '" + name + "'");
        offset += k * strides[pos];
        dims.erase(it);
        strides.erase(strides.begin() + static_cast<std::ptrdiff_t>(pos));
    }
    Tensor result = make_view(Shape(std::move(dims)), data_, std::move(strides), offset);
    for (const auto& [name, items] : gathers) {
        std::vector<Tensor> parts;
        for (const auto& item : items) {
            Index k = result.shape_.dim(name).item_index(item);
            PFL_THROW_IF(k < 0, OutOfRangeException, "Item '" + item + "' not in dimension '" + name + "'");
            parts.push_back(result.slice(Selection{{name, Range{k, k + 1}}}));
        }
        result = concat(parts, name).with_item_names(name, items);
    }
    return result;
}

Tensor Tensor::expand(const Shape& dims) const {
    if (!is_uniform()) {
        std::vector<Tensor> comps;
        Shape others = dims.without(stack_dim_);
        for (const auto& c : *components_) {
            comps.push_back(c.expand(others));
        }
        return stack(comps, shape_.dim(stack_dim_));
    }
    Shape out = dims.merged(shape_);
    if (out == shape_) {
        return *this;
    }
    std::vector<Index> strides(out.rank(), 0);
    for (std::size_t i = 0; i < out.rank(); ++i) {
        const Dim& d = out.dims()[i];
        int j = shape_.index_of(d.name);
        if (j >= 0 && shape_.dims()[static_cast<std::size_t>(j)].size == d.size) {
            strides[i] = strides_[static_cast<std::size_t>(j)];
        }
    }
    return make_view(out, data_, std::move(strides), offset_);
}

Tensor Tensor::rename(const std::string& name, const std::string& new_name) const {
    if (name == new_name || !shape_.contains(name)) {
        return *this;
    }
    if (!is_uniform()) {
        if (name == stack_dim_) {
            return make_stack(shape_.renamed(name, new_name), new_name, *components_);
        }
        std::vector<Tensor> comps;
        for (const auto& c : *components_) {
            comps.push_back(c.rename(name, new_name));
        }
        return make_stack(shape_.renamed(name, new_name), stack_dim_, std::move(comps));
    }
    Shape renamed = shape_.renamed(name, new_name);
    std::vector<Index> strides(renamed.rank(), 0);
    for (std::size_t i = 0; i < renamed.rank(); ++i) {
        const std::string& n = renamed.dims()[i].name;
        strides[i] = stride(n == new_name ? name : n);
    }
    return make_view(renamed, data_, std::move(strides), offset_);
}

Tensor Tensor::with_item_names(const std::string& name, const std::vector<std::string>& items) const {
    if (!shape_.contains(name)) {
        return *this;
    }
    Dim d = shape_.dim(name);
    d.item_names = items;
    if (!is_uniform()) {
        return make_stack(shape_.with_dim(d), stack_dim_, *components_);
    }
    return make_view(shape_.with_dim(d), data_, strides_, offset_);
}

Tensor Tensor::compact() const {
    if (!is_uniform()) {
        std::vector<Tensor> comps;
        for (const auto& c : *components_) {
            comps.push_back(c.compact());
        }
        return make_stack(shape_, stack_dim_, std::move(comps));
    }
    return Tensor(shape_, to_array());
}

namespace {

/// Dimensions of a dense tensor that are not collapsed
Shape active_shape(const Tensor& t) {
    std::vector<Dim> dims;
    for (const auto& d : t.shape().dims()) {
        if (!t.is_collapsed(d.name)) {
            dims.push_back(d);
        }
    }
    return Shape(std::move(dims));
}

/// Contiguous storage over the active dimensions, collapsed dimensions stay collapsed
Tensor packed(const Tensor& t) {
    Shape act = active_shape(t);
    Selection first;
    std::vector<std::string> order = act.names();
    for (const auto& d : t.shape().dims()) {
        if (!act.contains(d.name)) {
            first[d.name] = Range{0, 1};
            order.push_back(d.name);
        }
    }
    Eigen::ArrayXd data = t.slice(first).to_array(order);
    return Tensor(act, std::move(data)).expand(t.shape());
}

} // namespace

Tensor Tensor::map(UnaryOp op) const {
    return map([op](Real x) { return apply(op, x); });
}

Tensor Tensor::map(const std::function<Real(Real)>& fn) const {
    if (!is_uniform()) {
        std::vector<Tensor> comps;
        for (const auto& c : *components_) {
            comps.push_back(c.map(fn));
        }
        return make_stack(shape_, stack_dim_, std::move(comps));
    }
    Tensor p = packed(*this);
    auto data = std::make_shared<const Eigen::ArrayXd>(p.data_->unaryExpr(fn));
    return make_view(p.shape_, std::move(data), p.strides_, p.offset_);
}

// ============================================================================
// Reductions
// ============================================================================

Tensor Tensor::reduce(ReduceOp op) const {
    return reduce(op, shape_.names());
}

Tensor Tensor::reduce(ReduceOp op, const std::vector<std::string>& dims) const {
    std::vector<std::string> names;
    for (const auto& n : dims) {
        if (shape_.contains(n) && std::find(names.begin(), names.end(), n) == names.end()) {
            names.push_back(n);
        }
    }
    if (names.empty()) {
        return *this;
    }
    if (!is_uniform()) {
        bool over_stack = std::find(names.begin(), names.end(), stack_dim_) != names.end();
        std::vector<std::string> inner = names;
        inner.erase(std::remove(inner.begin(), inner.end(), stack_dim_), inner.end());
        if (!over_stack) {
            std::vector<Tensor> comps;
            for (const auto& c : *components_) {
                comps.push_back(c.reduce(op, inner));
            }
            return stack(comps, shape_.dim(stack_dim_));
        }
        ReduceOp inner_op = op == ReduceOp::Mean ? ReduceOp::Sum : op;
        Tensor acc;
        Real count = 0;
        for (std::size_t i = 0; i < components_->size(); ++i) {
            const Tensor& c = (*components_)[i];
            Tensor r = c.reduce(inner_op, inner);
            Real n = 1;
            for (const auto& name : inner) {
                if (c.shape().contains(name)) {
                    n *= static_cast<Real>(c.shape().size(name));
                }
            }
            count += n;
            if (i == 0) {
                acc = r;
                continue;
            }
            switch (op) {
                case ReduceOp::Sum:
                case ReduceOp::Mean: acc = acc + r; break;
                case ReduceOp::Min:
                case ReduceOp::All:  acc = minimum(acc, r); break;
                case ReduceOp::Max:
                case ReduceOp::Any:  acc = maximum(acc, r); break;
            }
        }
        return op == ReduceOp::Mean ? acc / Tensor(count) : acc;
    }

    Real collapsed_volume = 1;
    std::vector<std::string> active_names;
    for (const auto& n : names) {
        if (is_collapsed(n)) {
            collapsed_volume *= static_cast<Real>(shape_.size(n));
        } else {
            active_names.push_back(n);
        }
    }
    Tensor p = packed(*this);
    Shape act = active_shape(*this);
    Shape out_act = act.without(active_names);
    Index out_size = out_act.volume();

    Real init = 0;
    switch (op) {
        case ReduceOp::Min: init = std::numeric_limits<Real>::infinity(); break;
        case ReduceOp::Max: init = -std::numeric_limits<Real>::infinity(); break;
        case ReduceOp::All: init = 1; break;
        default: break;
    }
    Eigen::ArrayXd out = Eigen::ArrayXd::Constant(out_size, init);
    std::vector<Index> in_strides = p.aligned_strides(act);
    std::vector<Index> out_strides_full = row_major_strides(out_act.sizes());
    std::vector<Index> out_strides(act.rank(), 0);
    for (std::size_t i = 0; i < act.rank(); ++i) {
        int j = out_act.index_of(act.dims()[i].name);
        if (j >= 0) {
            out_strides[i] = out_strides_full[static_cast<std::size_t>(j)];
        }
    }
    Real reduced_count = 1;
    for (const auto& n : active_names) {
        reduced_count *= static_cast<Real>(shape_.size(n));
    }
    for_each_index(act.sizes(), [&](const std::vector<Index>& idx, Index) {
        Real x = (*p.data_)[linear(idx, in_strides, p.offset_)];
        Real& o = out[linear(idx, out_strides, 0)];
        switch (op) {
            case ReduceOp::Sum:
            case ReduceOp::Mean: o += x; break;
            case ReduceOp::Min:  o = std::min(o, x); break;
            case ReduceOp::Max:  o = std::max(o, x); break;
            case ReduceOp::Any:  o = (o != 0 || x != 0) ? Real(1) : Real(0); break;
            case ReduceOp::All:  o = (o != 0 && x != 0) ? Real(1) : Real(0); break;
        }
    });
    if (op == ReduceOp::Mean) {
        out /= reduced_count;
    } else if (op == ReduceOp::Sum) {
        out *= collapsed_volume;
    }
    return Tensor(out_act, std::move(out)).expand(shape_.without(names));
}

// ============================================================================
// Binary operations
// ============================================================================

namespace {

/// Split mixed uniform/non-uniform operands into per-component operations
template<typename Fn>
Tensor per_component(const std::vector<const Tensor*>& operands, Fn&& fn) {
    const Tensor* stacked = nullptr;
    for (const Tensor* t : operands) {
        if (!t->is_uniform()) {
            stacked = t;
            break;
        }
    }
    const std::string& s = stacked->stack_dim();
    const Dim& sd = stacked->shape().dim(s);
    for (const Tensor* t : operands) {
        if (!t->is_uniform()) {
            PFL_CHECK_SHAPE(t->stack_dim() == s && t->components().size() == stacked->components().size(),
                            "Non-uniform operands stacked differently");
        } else if (t->shape().contains(s)) {
            PFL_CHECK_SHAPE(t->shape().size(s) == sd.size || t->shape().size(s) == 1,
                            "Operand does not match stack dimension '" + s + "'");
        }
    }
    std::vector<Tensor> comps;
    for (Index i = 0; i < sd.size; ++i) {
        std::vector<Tensor> parts;
        for (const Tensor* t : operands) {
            if (t->is_uniform() && t->shape().contains(s) && t->shape().size(s) == 1) {
                parts.push_back(t->slice(Selection{{s, Index(0)}}));
            } else {
                parts.push_back(t->component(i, s));
            }
        }
        comps.push_back(fn(parts));
    }
    return Tensor::stack(comps, sd);
}

} // namespace

Tensor binary(const Tensor& a, const Tensor& b, BinaryOp op) {
    if (!a.is_uniform() || !b.is_uniform()) {
        return per_component({&a, &b}, [op](const std::vector<Tensor>& p) { return binary(p[0], p[1], op); });
    }
    Shape out = a.shape_.merged(b.shape_);
    std::vector<Index> sa = a.aligned_strides(out);
    std::vector<Index> sb = b.aligned_strides(out);

    if (a.shape_ == out && b.shape_ == out && a.offset_ == 0 && b.offset_ == 0 &&
        a.strides_ == b.strides_ && a.data_->size() == out.volume() && b.data_->size() == out.volume() &&
        a.strides_ == row_major_strides(out.sizes())) {
        Eigen::ArrayXd data = a.data_->binaryExpr(*b.data_, [op](Real x, Real y) { return apply(op, x, y); });
        return Tensor(out, std::move(data));
    }

    std::vector<Dim> active;
    std::vector<Index> sa_act;
    std::vector<Index> sb_act;
    for (std::size_t i = 0; i < out.rank(); ++i) {
        const Dim& d = out.dims()[i];
        if (d.size == 1 || sa[i] != 0 || sb[i] != 0) {
            active.push_back(d);
            sa_act.push_back(sa[i]);
            sb_act.push_back(sb[i]);
        }
    }
    Shape act(active);
    Eigen::ArrayXd data(act.volume());
    const Eigen::ArrayXd& da = *a.data_;
    const Eigen::ArrayXd& db = *b.data_;
    for_each_index(act.sizes(), [&](const std::vector<Index>& idx, Index k) {
        data[k] = apply(op, da[linear(idx, sa_act, a.offset_)], db[linear(idx, sb_act, b.offset_)]);
    });
    return Tensor(act, std::move(data)).expand(out);
}

Tensor where(const Tensor& cond, const Tensor& a, const Tensor& b) {
    if (!cond.is_uniform() || !a.is_uniform() || !b.is_uniform()) {
        return per_component({&cond, &a, &b},
                             [](const std::vector<Tensor>& p) { return where(p[0], p[1], p[2]); });
    }
    Shape out = cond.shape_.merged(a.shape_).merged(b.shape_);
    std::vector<Index> sc = cond.aligned_strides(out);
    std::vector<Index> sa = a.aligned_strides(out);
    std::vector<Index> sb = b.aligned_strides(out);
    std::vector<Dim> active;
    std::vector<Index> sc_act, sa_act, sb_act;
    for (std::size_t i = 0; i < out.rank(); ++i) {
        const Dim& d = out.dims()[i];
        if (d.size == 1 || sc[i] != 0 || sa[i] != 0 || sb[i] != 0) {
            active.push_back(d);
            sc_act.push_back(sc[i]);
            sa_act.push_back(sa[i]);
            sb_act.push_back(sb[i]);
        }
    }
    Shape act(active);
    Eigen::ArrayXd data(act.volume());
    for_each_index(act.sizes(), [&](const std::vector<Index>& idx, Index k) {
        bool c = (*cond.data_)[linear(idx, sc_act, cond.offset_)] != 0;
        data[k] = c ? (*a.data_)[linear(idx, sa_act, a.offset_)] : (*b.data_)[linear(idx, sb_act, b.offset_)];
    });
    return Tensor(act, std::move(data)).expand(out);
}

bool close(const Tensor& a, const Tensor& b, Real rtol, Real atol) {
    if (!a.is_uniform() || !b.is_uniform()) {
        const Tensor& stacked = a.is_uniform() ? b : a;
        const std::string& s = stacked.stack_dim();
        const Tensor& other = a.is_uniform() ? a : b;
        if (!other.is_uniform() && (other.stack_dim() != s ||
                                    other.components().size() != stacked.components().size())) {
            return false;
        }
        if (other.is_uniform() && other.shape().contains(s) &&
            other.shape().size(s) != static_cast<Index>(stacked.components().size())) {
            return false;
        }
        for (std::size_t i = 0; i < stacked.components().size(); ++i) {
            if (!close(stacked.component(static_cast<Index>(i), s),
                       other.component(static_cast<Index>(i), s), rtol, atol)) {
                return false;
            }
        }
        return true;
    }
    Shape merged;
    if (!a.shape().try_merge(b.shape(), merged)) {
        return false;
    }
    Tensor diff = abs(a - b);
    Tensor tol = Tensor(atol) + Tensor(rtol) * abs(b);
    return binary(diff, tol, BinaryOp::LessEqual).reduce(ReduceOp::All).item() != 0;
}

namespace {

/// Number of entries of `selection` naming dimensions of `shape`
std::size_t present_entries(const Selection& selection, const Shape& shape) {
    return static_cast<std::size_t>(std::count_if(selection.begin(), selection.end(),
                                                  [&](const auto& e) { return shape.contains(e.first); }));
}

/// Positions along `dim` picked by `item`
std::set<Index> picked_indices(const Shape& shape, const std::string& dim, const SliceItem& item) {
    const Dim& d = shape.dim(dim);
    Tensor ids = Tensor::arange(d).with_item_names(dim, d.item_names).slice(Selection{{dim, item}});
    std::set<Index> picked;
    if (ids.is_scalar()) {
        picked.insert(static_cast<Index>(ids.item()));
    } else {
        for (Real id : ids.to_vector()) {
            picked.insert(static_cast<Index>(id));
        }
    }
    return picked;
}

} // namespace

Tensor slice_off(const Tensor& value, const std::vector<Selection>& slices) {
    if (slices.empty()) {
        return value;
    }
    // A selection over several dimensions removes a block. Such selections,
    // and all selections on non-uniform tensors, are resolved per component.
    std::string split;
    if (!value.is_uniform()) {
        split = value.stack_dim();
    } else {
        for (const auto& sel : slices) {
            if (present_entries(sel, value.shape()) > 1) {
                // Split along the entry naming components, else the one picking a single index
                std::size_t best = 0;
                for (const auto& [name, item] : sel) {
                    if (!value.shape().contains(name)) {
                        continue;
                    }
                    const std::size_t priority = std::holds_alternative<Range>(item) ? 1
                                                 : std::holds_alternative<Index>(item) ? 2 : 3;
                    if (priority > best) {
                        best = priority;
                        split = name;
                    }
                }
                break;
            }
        }
    }
    if (!split.empty()) {
        const Dim& sd = value.shape().dim(split);
        std::set<Index> removed;
        std::vector<std::vector<Selection>> per_component(static_cast<std::size_t>(sd.size));
        for (const auto& sel : slices) {
            auto it = sel.find(split);
            Selection rest = sel;
            rest.erase(split);
            if (it == sel.end()) {
                for (auto& c : per_component) {
                    c.push_back(rest);
                }
                continue;
            }
            const bool block = present_entries(rest, value.shape()) > 0;
            for (Index i : picked_indices(value.shape(), split, it->second)) {
                if (block) {
                    per_component[static_cast<std::size_t>(i)].push_back(rest);
                } else {
                    removed.insert(i);
                }
            }
        }
        std::vector<Tensor> comps;
        std::vector<std::string> items;
        for (Index i = 0; i < sd.size; ++i) {
            if (removed.count(i) > 0) {
                continue;
            }
            comps.push_back(slice_off(value.component(i, split), per_component[static_cast<std::size_t>(i)]));
            if (!sd.item_names.empty()) {
                items.push_back(sd.item_names[static_cast<std::size_t>(i)]);
            }
        }
        PFL_CHECK_ARG(!comps.empty(), "slice_off removed every entry of '" + split + "'");
        Dim d = sd;
        d.size = static_cast<Index>(comps.size());
        d.item_names = items;
        return Tensor::stack(comps, d);
    }

    std::map<std::string, std::set<Index>> removed;
    for (const auto& sel : slices) {
        for (const auto& [name, item] : sel) {
            if (value.shape().contains(name)) {
                std::set<Index> picked = picked_indices(value.shape(), name, item);
                removed[name].insert(picked.begin(), picked.end());
            }
        }
    }
    Tensor result = value;
    for (const auto& [name, set] : removed) {
        Index n = result.shape().size(name);
        std::vector<Tensor> parts;
        Index start = 0;
        for (Index i = 0; i <= n; ++i) {
            if (i == n || set.count(i) > 0) {
                if (i > start) {
                    parts.push_back(result.slice(Selection{{name, Range{start, i}}}));
                }
                start = i + 1;
            }
        }
        PFL_CHECK_ARG(!parts.empty(), "slice_off removed all of dimension '" + name + "'");
        result = Tensor::concat(parts, name);
    }
    return result;
}

std::string Tensor::to_string() const {
    std::ostringstream oss;
    oss << shape_.to_string();
    if (!is_uniform()) {
        oss << " non-uniform along " << stack_dim_;
        return oss.str();
    }
    Index n = shape_.volume();
    if (n <= 12) {
        Eigen::ArrayXd values = to_array();
        oss << " [";
        for (Index i = 0; i < n; ++i) {
            oss << (i > 0 ? ", " : "") << values[i];
        }
        oss << "]";
    } else {
        Tensor lo = reduce(ReduceOp::Min);
        Tensor hi = reduce(ReduceOp::Max);
        oss << " " << lo.item() << " < ... < " << hi.item();
    }
    return oss.str();
}

} // namespace math
} // namespace pfl
