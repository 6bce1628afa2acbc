/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_EXTRAPOLATION_CONSTANTS_H
#define PFL_EXTRAPOLATION_CONSTANTS_H

/**
 * @file Constants.h
 * @brief Shared immutable extrapolation instances and conversions
 */

#include "pfl/Extrapolation/ConstantExtrapolation.h"
#include "pfl/Extrapolation/CopyExtrapolation.h"
#include "pfl/Extrapolation/MixedExtrapolation.h"

namespace pfl {
namespace extrapolation {

inline const ExtrapolationPtr ZERO = std::make_shared<const ConstantExtrapolation>(Real(0));
inline const ExtrapolationPtr ONE = std::make_shared<const ConstantExtrapolation>(Real(1));
inline const ExtrapolationPtr PERIODIC = std::make_shared<const PeriodicExtrapolation>();
inline const ExtrapolationPtr ZERO_GRADIENT = std::make_shared<const ZeroGradientExtrapolation>();
/// Alias of ZERO_GRADIENT
inline const ExtrapolationPtr BOUNDARY = ZERO_GRADIENT;
inline const ExtrapolationPtr SYMMETRIC = std::make_shared<const SymmetricExtrapolation>();
inline const ExtrapolationPtr REFLECT = std::make_shared<const ReflectExtrapolation>();

/// @name Conversions
/// @{
ExtrapolationPtr as_extrapolation(Real value);
ExtrapolationPtr as_extrapolation(const std::map<std::string, ExtrapolationPtr>& per_dim);
ExtrapolationPtr as_extrapolation(const std::map<std::string, MixedExtrapolation::Sides>& per_side);
/// @}

} // namespace extrapolation
} // namespace pfl

#endif // PFL_EXTRAPOLATION_CONSTANTS_H
