/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_FIELD_RESAMPLE_H
#define PFL_FIELD_RESAMPLE_H

/**
 * @file Resample.h
 * @brief Conversion of fields, initializers and geometries into sampled values
 *
 * Every sample() overload returns the values located at the centers or at
 * the faces of a target geometry, without the faces that the target
 * boundary rule fixes. Supported conversions:
 *
 *  - grid field onto any geometry: multilinear interpolation; neighbours
 *    outside the grid follow the source rule
 *  - mesh field onto the same mesh (cells to faces and back) or onto a
 *    grid: piecewise constant by point location
 *  - point cloud onto grid cells: scatter with mean or sum
 *  - analytic initializers and constants: evaluated at the sample points
 *  - geometries: indicator, 1 inside and 0 outside
 *
 * Vector values sampled at grid faces keep the component normal to each
 * face. Other conversions throw NotImplementedException.
 */

#include "pfl/Field/Field.h"

#include <string>

namespace pfl {
namespace geometry {
class UniformGrid;
}

namespace field {

/// Positions of the values of a field sampled on `geometry` at `at` under `boundary`
math::Tensor sample_points(const GeometryPtr& geometry, SampleLocation at, const ExtrapolationPtr& boundary);

math::Tensor sample(const Field& source, const GeometryPtr& geometry, SampleLocation at,
                    const ExtrapolationPtr& boundary, const SampleOptions& options = {});

math::Tensor sample(const Initializer& initializer, const GeometryPtr& geometry, SampleLocation at,
                    const ExtrapolationPtr& boundary, const SampleOptions& options = {});

/// Indicator of `shape`; soft sampling ramps over the diameter of the target elements
math::Tensor sample(const GeometryPtr& shape, const GeometryPtr& geometry, SampleLocation at,
                    const ExtrapolationPtr& boundary, const SampleOptions& options = {});

math::Tensor sample(const math::Tensor& value, const GeometryPtr& geometry, SampleLocation at,
                    const ExtrapolationPtr& boundary, const SampleOptions& options = {});

/**
 * @brief Values of a grid or mesh field at arbitrary positions
 *
 * `points` carries `vector`; the result has its other dimensions plus the
 * non-spatial dimensions of the field values.
 */
math::Tensor sample_at_points(const Field& source, const math::Tensor& points);

/**
 * @brief `value` on the geometry and sample location of `to`
 *
 * The result takes the rule of `to`, or keeps the rule of `value` when
 * `keep_extrapolation` is set. Resampling a field onto its own
 * representation returns it unchanged.
 */
Field resample(const Field& value, const Field& to, bool keep_extrapolation = false,
               const SampleOptions& options = {});

/**
 * @brief Physical positions of grid samples, for padding with embedded fields
 *
 * Centers when `face_axis` is empty, otherwise the faces normal to
 * `face_axis` of which the lowest `skipped_lower` are not stored.
 */
extrapolation::PadCoordinates sample_coordinates(const geometry::UniformGrid& grid,
                                                 const std::string& face_axis = "",
                                                 Index skipped_lower = 0);

} // namespace field
} // namespace pfl

#endif // PFL_FIELD_RESAMPLE_H
