/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_EXTRAPOLATION_EXTRAPOLATION_H
#define PFL_EXTRAPOLATION_EXTRAPOLATION_H

/**
 * @file Extrapolation.h
 * @brief Abstract rule for values outside the sampled domain
 *
 * An Extrapolation defines how a tensor continues beyond its last sample
 * along each spatial dimension and how two such rules combine when the
 * fields carrying them are combined arithmetically.
 *
 * Boundary keys name one side of the domain. Grids use "<dim>-" for the
 * lower and "<dim>+" for the upper side; meshes use their boundary names.
 *
 * Instances are immutable and held by shared pointer. Equality is by value.
 */

#include "pfl/Core/Types.h"
#include "pfl/Math/Selection.h"
#include "pfl/Math/Tensor.h"

#include <map>
#include <memory>
#include <string>
#include <utility>

namespace pfl {
namespace extrapolation {

class Extrapolation;
using ExtrapolationPtr = std::shared_ptr<const Extrapolation>;

/// Number of cells added below and above, per dimension
using PadWidths = std::map<std::string, std::pair<Index, Index>>;

/**
 * @brief Physical position of tensor indices, needed by field embeddings
 *
 * Index i along `dim` lies at origin + i * spacing.
 */
struct PadCoordinates {
    std::map<std::string, std::pair<Real, Real>> axes;

    Real coordinate(const std::string& dim, Index i) const;
    /// Account for `lower` cells prepended along `dim`
    void grow_lower(const std::string& dim, Index lower);
};

std::string boundary_key(const std::string& dim, bool upper);

/**
 * @brief Split "<dim>-" / "<dim>+" into its parts
 * @return false if `key` is not a grid boundary key (e.g. a mesh boundary name)
 */
bool parse_boundary_key(const std::string& key, std::string& dim, bool& upper);

class Extrapolation : public std::enable_shared_from_this<Extrapolation> {
public:
    virtual ~Extrapolation() = default;

    virtual std::string to_string() const = 0;
    virtual bool equals(const Extrapolation& other) const = 0;

    /**
     * @brief Whether values on the boundary `key` follow from this rule alone
     *
     * Faces on such boundaries are not stored by staggered fields.
     */
    virtual bool determines_boundary_values(const std::string& key) const = 0;

    /// (lower, upper) faces along `dim` that must be stored explicitly
    std::pair<bool, bool> valid_outer_faces(const std::string& dim) const;

    /// Rule applying on one side of `dim`
    virtual ExtrapolationPtr on_side(const std::string& dim, bool upper) const;
    /// Rule applying to one vector component
    virtual ExtrapolationPtr component(const std::string& item) const;
    virtual ExtrapolationPtr slice(const math::Selection& selection) const;
    /// Rule for the spatial gradient of a quantity following this rule
    virtual ExtrapolationPtr spatial_gradient() const = 0;
    /// Rule after applying `op` to the values
    virtual ExtrapolationPtr transform(math::UnaryOp op) const = 0;

    /// True if padding only copies existing values (no new constants)
    virtual bool copies_values() const { return false; }

    /**
     * @brief Combine with `other` placed on the given side of the operator
     * @return nullptr if this variant cannot resolve the pair
     */
    virtual ExtrapolationPtr combine_with(const Extrapolation& other, math::BinaryOp op,
                                          bool this_is_left) const = 0;

    /**
     * @brief Pad `value` along every dimension listed in `widths`
     *
     * Dimensions are padded one after another; `coords`, if given, is kept
     * up to date so that later dimensions see the grown domain. Collapsed
     * dimensions stay collapsed. Dimensions the tensor does not have are
     * skipped.
     */
    math::Tensor pad(const math::Tensor& value, const PadWidths& widths,
                     PadCoordinates* coords = nullptr) const;

    /**
     * @brief Values of the `width` cells beyond one side of `core`
     *
     * `core` is uniform and non-empty along `dim`.
     */
    virtual math::Tensor pad_slab(const math::Tensor& core, const std::string& dim, bool upper,
                                  Index width, const PadCoordinates* coords) const = 0;

    ExtrapolationPtr ptr() const { return shared_from_this(); }

protected:
    Extrapolation() = default;

private:
    math::Tensor pad_dim(const math::Tensor& value, const std::string& dim, Index lower, Index upper,
                         const PadCoordinates* coords) const;
};

inline bool operator==(const Extrapolation& a, const Extrapolation& b) { return a.equals(b); }
inline bool operator!=(const Extrapolation& a, const Extrapolation& b) { return !a.equals(b); }

/// Value equality of two rules (both may be null)
bool same(const ExtrapolationPtr& a, const ExtrapolationPtr& b);

/**
 * @brief Rule of `a op b`
 * @throws IncompatibleExtrapolations if neither side can resolve the pair
 */
ExtrapolationPtr combine(const ExtrapolationPtr& a, const ExtrapolationPtr& b, math::BinaryOp op);
ExtrapolationPtr transform(const ExtrapolationPtr& e, math::UnaryOp op);

inline ExtrapolationPtr operator+(const ExtrapolationPtr& a, const ExtrapolationPtr& b) {
    return combine(a, b, math::BinaryOp::Add);
}
inline ExtrapolationPtr operator-(const ExtrapolationPtr& a, const ExtrapolationPtr& b) {
    return combine(a, b, math::BinaryOp::Sub);
}
inline ExtrapolationPtr operator*(const ExtrapolationPtr& a, const ExtrapolationPtr& b) {
    return combine(a, b, math::BinaryOp::Mul);
}
inline ExtrapolationPtr operator/(const ExtrapolationPtr& a, const ExtrapolationPtr& b) {
    return combine(a, b, math::BinaryOp::Div);
}
inline ExtrapolationPtr operator-(const ExtrapolationPtr& e) {
    return transform(e, math::UnaryOp::Neg);
}

/// Free-function form of Extrapolation::pad
math::Tensor pad(const math::Tensor& value, const PadWidths& widths, const ExtrapolationPtr& extrapolation,
                 PadCoordinates* coords = nullptr);

} // namespace extrapolation
} // namespace pfl

#endif // PFL_EXTRAPOLATION_EXTRAPOLATION_H
