/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_MATH_TENSOR_H
#define PFL_MATH_TENSOR_H

/**
 * @file Tensor.h
 * @brief Immutable named-dimension tensor backed by Eigen storage
 *
 * Tensors align by dimension name. Storage is shared between a tensor and
 * every view derived from it (slices, renames, expansions), so those
 * operations never copy. A dimension with stride zero is "collapsed": its
 * values are constant along it and only one value is stored.
 *
 * A tensor may also be non-uniform: a stack of component tensors whose
 * shapes differ. Staggered grid values are stored this way, with one
 * component per vector axis stacked along `~vector`.
 */

#include "pfl/Core/Types.h"
#include "pfl/Core/PFLConfig.h"
#include "pfl/Math/Selection.h"
#include "pfl/Math/Shape.h"

#include <Eigen/Core>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pfl {
namespace math {

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Pow,
    Min,
    Max,
    Greater,
    GreaterEqual,
    Less,
    LessEqual,
    And,
    Or
};

enum class UnaryOp : std::uint8_t {
    Neg,
    Abs,
    Sqrt,
    Exp,
    Log,
    Sin,
    Cos,
    Sign,
    Not
};

const char* to_string(BinaryOp op);
const char* to_string(UnaryOp op);
Real apply(BinaryOp op, Real a, Real b);
Real apply(UnaryOp op, Real a);

enum class ReduceOp : std::uint8_t {
    Sum,
    Mean,
    Min,
    Max,
    Any,
    All
};

class Tensor {
public:
    /// Scalar zero
    Tensor();
    /// Scalar
    Tensor(Real value);
    /// Dense tensor; `data` is laid out row-major in shape order
    Tensor(const Shape& shape, Eigen::ArrayXd data);

    /// @name Factories
    /// @{
    /// Constant tensor; every dimension is collapsed
    static Tensor full(const Shape& shape, Real value);
    static Tensor zeros(const Shape& shape) { return full(shape, Real(0)); }
    static Tensor ones(const Shape& shape) { return full(shape, Real(1)); }
    static Tensor from_values(const Shape& shape, const std::vector<Real>& values);
    /// Channel vector along `vector` with the given axis names
    static Tensor vector(const std::vector<std::string>& axes, const std::vector<Real>& values);
    /// `dim.size` values from start to stop inclusive
    static Tensor linspace(Real start, Real stop, const Dim& dim);
    /// 0, 1, ..., dim.size-1
    static Tensor arange(const Dim& dim);
    /**
     * @brief Stack values along a new dimension
     *
     * Produces a dense tensor when the shapes broadcast and a non-uniform
     * tensor otherwise.
     */
    static Tensor stack(const std::vector<Tensor>& values, const Dim& dim);
    /// Concatenate along an existing dimension
    static Tensor concat(const std::vector<Tensor>& values, const std::string& dim);
    /// @}

    const Shape& shape() const noexcept { return shape_; }
    bool is_uniform() const noexcept { return components_ == nullptr; }
    bool is_scalar() const noexcept { return shape_.empty(); }

    /// Dimension the components of a non-uniform tensor are stacked along
    const std::string& stack_dim() const;
    const std::vector<Tensor>& components() const;
    /// Component of a non-uniform tensor, or a slice along the same dim of a uniform one
    Tensor component(Index i, const std::string& dim) const;

    /// True if `name` has size > 1 but only one stored value along it
    bool is_collapsed(const std::string& name) const;
    /// Number of values held in storage
    Index stored_size() const;

    /// The single value of a tensor with exactly one element
    Real item() const;
    /// Element at a named index; missing names default to 0
    Real value(const std::map<std::string, Index>& index = {}) const;
    /// Values flattened row-major in `order` (shape order when empty)
    Eigen::ArrayXd to_array(const std::vector<std::string>& order = {}) const;
    std::vector<Real> to_vector(const std::vector<std::string>& order = {}) const;

    Tensor slice(const Selection& selection) const;
    /// Broadcast to `dims` without copying
    Tensor expand(const Shape& dims) const;
    /// Rename a dimension; a leading `~` makes it dual
    Tensor rename(const std::string& name, const std::string& new_name) const;
    Tensor with_item_names(const std::string& name, const std::vector<std::string>& items) const;
    /// Contiguous copy with collapsed dimensions materialized
    Tensor compact() const;

    Tensor map(UnaryOp op) const;
    Tensor map(const std::function<Real(Real)>& fn) const;
    /// Reduce the listed dimensions; names not present are ignored
    Tensor reduce(ReduceOp op, const std::vector<std::string>& dims) const;
    /// Reduce all dimensions
    Tensor reduce(ReduceOp op) const;

    Tensor sum(const std::vector<std::string>& dims) const { return reduce(ReduceOp::Sum, dims); }
    Tensor mean(const std::vector<std::string>& dims) const { return reduce(ReduceOp::Mean, dims); }
    Tensor min(const std::vector<std::string>& dims) const { return reduce(ReduceOp::Min, dims); }
    Tensor max(const std::vector<std::string>& dims) const { return reduce(ReduceOp::Max, dims); }
    Tensor any(const std::vector<std::string>& dims) const { return reduce(ReduceOp::Any, dims); }
    Tensor all(const std::vector<std::string>& dims) const { return reduce(ReduceOp::All, dims); }

    std::string to_string() const;

private:
    friend Tensor binary(const Tensor& a, const Tensor& b, BinaryOp op);
    friend Tensor where(const Tensor& cond, const Tensor& a, const Tensor& b);

    static Tensor make_view(Shape shape, std::shared_ptr<const Eigen::ArrayXd> data,
                            std::vector<Index> strides, Index offset);
    static Tensor make_stack(const Shape& shape, const std::string& stack_dim,
                             std::vector<Tensor> components);

    /// Strides of this dense tensor aligned with the dimensions of `out`
    std::vector<Index> aligned_strides(const Shape& out) const;
    Index stride(const std::string& name) const;

    Shape shape_;
    std::shared_ptr<const Eigen::ArrayXd> data_;
    std::vector<Index> strides_;
    Index offset_ = 0;

    std::string stack_dim_;
    std::shared_ptr<const std::vector<Tensor>> components_;
};

/// Element-wise binary operation with named broadcasting
Tensor binary(const Tensor& a, const Tensor& b, BinaryOp op);
/// Element-wise selection, cond != 0 picks `a`
Tensor where(const Tensor& cond, const Tensor& a, const Tensor& b);

/**
 * @brief Approximate equality
 *
 * Returns false instead of throwing when the shapes are incompatible.
 */
bool close(const Tensor& a, const Tensor& b,
           Real rtol = config::CLOSE_RTOL, Real atol = config::CLOSE_ATOL);

/// Remove slices from a tensor; selections naming missing dims are ignored
Tensor slice_off(const Tensor& value, const std::vector<Selection>& slices);

inline Tensor operator+(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Add); }
inline Tensor operator-(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Sub); }
inline Tensor operator*(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Mul); }
inline Tensor operator/(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Div); }
inline Tensor operator-(const Tensor& a) { return a.map(UnaryOp::Neg); }

inline Tensor minimum(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Min); }
inline Tensor maximum(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Max); }
inline Tensor pow(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Pow); }
inline Tensor greater(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Greater); }
inline Tensor less(const Tensor& a, const Tensor& b) { return binary(a, b, BinaryOp::Less); }
inline Tensor sqrt(const Tensor& a) { return a.map(UnaryOp::Sqrt); }
inline Tensor abs(const Tensor& a) { return a.map(UnaryOp::Abs); }
inline Tensor clip(const Tensor& a, Real lo, Real hi) { return minimum(maximum(a, lo), hi); }

} // namespace math
} // namespace pfl

#endif // PFL_MATH_TENSOR_H
