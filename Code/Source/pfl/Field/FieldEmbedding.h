/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_FIELD_FIELDEMBEDDING_H
#define PFL_FIELD_FIELDEMBEDDING_H

/**
 * @file FieldEmbedding.h
 * @brief Boundary rule that takes the outside values from another field
 */

#include "pfl/Extrapolation/Extrapolation.h"
#include "pfl/Field/Field.h"

namespace pfl {
namespace field {

/**
 * @brief Values beyond the domain are sampled from an enclosing field
 *
 * Fixes every boundary. Padding needs the physical positions of the new
 * samples, so pad() must be called with PadCoordinates.
 */
class FieldEmbedding : public extrapolation::Extrapolation {
public:
    explicit FieldEmbedding(Field field);

    const Field& field() const noexcept { return field_; }

    std::string to_string() const override;
    bool equals(const Extrapolation& other) const override;
    bool determines_boundary_values(const std::string&) const override { return true; }
    ExtrapolationPtr component(const std::string& item) const override;
    ExtrapolationPtr slice(const math::Selection& selection) const override;
    ExtrapolationPtr spatial_gradient() const override;
    ExtrapolationPtr transform(math::UnaryOp op) const override;
    ExtrapolationPtr combine_with(const Extrapolation& other, math::BinaryOp op,
                                  bool this_is_left) const override;
    math::Tensor pad_slab(const math::Tensor& core, const std::string& dim, bool upper,
                          Index width, const extrapolation::PadCoordinates* coords) const override;

private:
    Field field_;
};

} // namespace field
} // namespace pfl

#endif // PFL_FIELD_FIELDEMBEDDING_H
