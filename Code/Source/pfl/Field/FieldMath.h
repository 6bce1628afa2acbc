/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_FIELD_FIELDMATH_H
#define PFL_FIELD_FIELDMATH_H

/**
 * @file FieldMath.h
 * @brief Stacking, concatenation and padding of fields
 */

#include "pfl/Field/Field.h"

#include <string>
#include <vector>

namespace pfl {
namespace field {

/**
 * @brief Fields stacked along a new dimension
 *
 * Fields sharing one geometry keep it; otherwise the geometries are stacked
 * as well. All fields must have the same boundary rule and sample location.
 */
Field stack(const std::vector<Field>& fields, const math::Dim& dim);

/// Point and sphere fields joined along an existing instance dimension
Field concat(const std::vector<Field>& fields, const std::string& dim);

/// Grid field extended by `widths` cells, values filled by its rule; the grid grows accordingly
Field pad(const Field& field, const extrapolation::PadWidths& widths);

/// Same width on both sides of every axis
Field pad(const Field& field, Index width);

} // namespace field
} // namespace pfl

#endif // PFL_FIELD_FIELDMATH_H
