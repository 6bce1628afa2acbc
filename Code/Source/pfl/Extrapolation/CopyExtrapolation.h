/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_EXTRAPOLATION_COPYEXTRAPOLATION_H
#define PFL_EXTRAPOLATION_COPYEXTRAPOLATION_H

/**
 * @file CopyExtrapolation.h
 * @brief Rules that fill outside cells with copies of inside values
 *
 * Each variant is an index map from a position outside [0, n) to a
 * position inside. Arithmetic on the values does not change the rule, so
 * two copy rules of the same type combine to themselves under any operator.
 */

#include "pfl/Extrapolation/Extrapolation.h"

namespace pfl {
namespace extrapolation {

class CopyExtrapolation : public Extrapolation {
public:
    /// Index inside [0, n) whose value appears at `position`
    virtual Index source_index(Index position, Index n) const = 0;

    bool equals(const Extrapolation& other) const override;
    bool determines_boundary_values(const std::string&) const override { return false; }
    bool copies_values() const override { return true; }
    ExtrapolationPtr transform(math::UnaryOp) const override { return ptr(); }
    ExtrapolationPtr combine_with(const Extrapolation& other, math::BinaryOp op,
                                  bool this_is_left) const override;
    math::Tensor pad_slab(const math::Tensor& core, const std::string& dim, bool upper,
                          Index width, const PadCoordinates* coords) const override;
};

/// Repeats the edge value (Neumann-type boundary)
class ZeroGradientExtrapolation : public CopyExtrapolation {
public:
    Index source_index(Index position, Index n) const override;
    std::string to_string() const override { return "zero-gradient"; }
    ExtrapolationPtr spatial_gradient() const override;
};

/// Wraps around; the upper face coincides with the lower one
class PeriodicExtrapolation : public CopyExtrapolation {
public:
    Index source_index(Index position, Index n) const override;
    std::string to_string() const override { return "periodic"; }
    bool determines_boundary_values(const std::string& key) const override;
    ExtrapolationPtr spatial_gradient() const override { return ptr(); }
};

/// Mirrors values including the edge cell: [a b c] -> c b a | a b c | c b a
class SymmetricExtrapolation : public CopyExtrapolation {
public:
    Index source_index(Index position, Index n) const override;
    std::string to_string() const override { return "symmetric"; }
    ExtrapolationPtr spatial_gradient() const override;
};

/// Mirrors values excluding the edge cell: [a b c] -> c b | a b c | b a
class ReflectExtrapolation : public CopyExtrapolation {
public:
    Index source_index(Index position, Index n) const override;
    std::string to_string() const override { return "reflect"; }
    ExtrapolationPtr spatial_gradient() const override;
};

} // namespace extrapolation
} // namespace pfl

#endif // PFL_EXTRAPOLATION_COPYEXTRAPOLATION_H
