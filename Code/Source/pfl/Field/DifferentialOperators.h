/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_FIELD_DIFFERENTIALOPERATORS_H
#define PFL_FIELD_DIFFERENTIALOPERATORS_H

/**
 * @file DifferentialOperators.h
 * @brief Spatial derivatives and coarsening of fields
 *
 * Field delegates its differential operators to one process-wide instance
 * of DifferentialOperators, which can be replaced to plug in other
 * discretizations. The default instance uses second-order finite
 * differences on uniform grids.
 */

#include "pfl/Field/Field.h"

#include <memory>
#include <string>
#include <vector>

namespace pfl {
namespace field {

/**
 * @brief Discretization of the differential operators
 */
class DifferentialOperators {
public:
    virtual ~DifferentialOperators() = default;

    /// Scalar field to a vector field (centers) or a staggered field (faces)
    virtual Field gradient(const Field& field, const GradientOptions& options) const = 0;
    virtual Field divergence(const Field& field, int order) const = 0;
    virtual Field curl(const Field& field) const = 0;
    virtual Field laplace(const Field& field, const std::vector<std::string>& dims, int order) const = 0;
    /// Halve the resolution along every axis
    virtual Field downsample2x(const Field& field) const = 0;
};

using DifferentialOperatorsPtr = std::shared_ptr<const DifferentialOperators>;

/**
 * @brief Second-order finite differences on uniform grids
 *
 * Neighbours outside the grid follow the field's rule. Derived fields take
 * the spatial gradient of that rule unless a rule is given.
 */
class FiniteDifferenceOperators : public DifferentialOperators {
public:
    Field gradient(const Field& field, const GradientOptions& options) const override;
    Field divergence(const Field& field, int order) const override;
    /// 2D only; the result lives on the cell corners
    Field curl(const Field& field) const override;
    Field laplace(const Field& field, const std::vector<std::string>& dims, int order) const override;
    Field downsample2x(const Field& field) const override;
};

/// Instance used by Field
DifferentialOperatorsPtr differential_operators();

/// Replace the instance used by Field; null restores finite differences
void set_differential_operators(DifferentialOperatorsPtr operators);

} // namespace field
} // namespace pfl

#endif // PFL_FIELD_DIFFERENTIALOPERATORS_H
