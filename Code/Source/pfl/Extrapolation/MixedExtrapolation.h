/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_EXTRAPOLATION_MIXEDEXTRAPOLATION_H
#define PFL_EXTRAPOLATION_MIXEDEXTRAPOLATION_H

/**
 * @file MixedExtrapolation.h
 * @brief Different rules per dimension and side
 */

#include "pfl/Extrapolation/Extrapolation.h"

namespace pfl {
namespace extrapolation {

class MixedExtrapolation : public Extrapolation {
public:
    /// (lower, upper) rules
    using Sides = std::pair<ExtrapolationPtr, ExtrapolationPtr>;

    /**
     * @param rules Keyed by spatial dimension name, or by boundary name for meshes
     */
    explicit MixedExtrapolation(std::map<std::string, Sides> rules);

    const std::map<std::string, Sides>& rules() const noexcept { return rules_; }

    std::string to_string() const override;
    bool equals(const Extrapolation& other) const override;
    bool determines_boundary_values(const std::string& key) const override;
    ExtrapolationPtr on_side(const std::string& dim, bool upper) const override;
    ExtrapolationPtr component(const std::string& item) const override;
    ExtrapolationPtr slice(const math::Selection& selection) const override;
    ExtrapolationPtr spatial_gradient() const override;
    ExtrapolationPtr transform(math::UnaryOp op) const override;

    /**
     * @brief Combine per key
     *
     * A key missing on one side stands for the identity of `op` (0 for + and
     * -, 1 for * and /) and then follows the regular rules, so
     * {x: PERIODIC} + {y: ONE} is fine while {x: ONE} / {y: PERIODIC} is not.
     */
    ExtrapolationPtr combine_with(const Extrapolation& other, math::BinaryOp op,
                                  bool this_is_left) const override;
    math::Tensor pad_slab(const math::Tensor& core, const std::string& dim, bool upper,
                          Index width, const PadCoordinates* coords) const override;

private:
    const Sides& sides(const std::string& key) const;

    template<typename Fn>
    ExtrapolationPtr map_rules(Fn&& fn) const;

    std::map<std::string, Sides> rules_;
};

/**
 * @brief Mixed rule, simplified to a single rule when all entries agree
 */
ExtrapolationPtr mixed(std::map<std::string, MixedExtrapolation::Sides> rules);

} // namespace extrapolation
} // namespace pfl

#endif // PFL_EXTRAPOLATION_MIXEDEXTRAPOLATION_H
