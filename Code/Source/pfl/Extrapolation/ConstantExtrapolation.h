/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_EXTRAPOLATION_CONSTANTEXTRAPOLATION_H
#define PFL_EXTRAPOLATION_CONSTANTEXTRAPOLATION_H

/**
 * @file ConstantExtrapolation.h
 * @brief Fixed value outside the domain (Dirichlet-type boundary)
 */

#include "pfl/Extrapolation/Extrapolation.h"

namespace pfl {
namespace extrapolation {

class ConstantExtrapolation : public Extrapolation {
public:
    explicit ConstantExtrapolation(Real value) : value_(value) {}

    Real value() const noexcept { return value_; }

    std::string to_string() const override;
    bool equals(const Extrapolation& other) const override;
    /// Constants fix every boundary
    bool determines_boundary_values(const std::string&) const override { return true; }
    ExtrapolationPtr spatial_gradient() const override;
    ExtrapolationPtr transform(math::UnaryOp op) const override;
    ExtrapolationPtr combine_with(const Extrapolation& other, math::BinaryOp op,
                                  bool this_is_left) const override;
    math::Tensor pad_slab(const math::Tensor& core, const std::string& dim, bool upper,
                          Index width, const PadCoordinates* coords) const override;

private:
    Real value_;
};

ExtrapolationPtr constant(Real value);

} // namespace extrapolation
} // namespace pfl

#endif // PFL_EXTRAPOLATION_CONSTANTEXTRAPOLATION_H
