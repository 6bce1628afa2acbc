/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_CORE_TYPES_H
#define PFL_CORE_TYPES_H

/**
 * @file Types.h
 * @brief Fundamental type definitions for the field library
 *
 * Core scalar and index aliases, dimension kinds and status codes shared by
 * the Math, Extrapolation, Geometry and Field modules.
 */

#include <cstdint>
#include <string>

namespace pfl {

// ============================================================================
// Scalar and Index Types
// ============================================================================

#ifdef PFL_USE_SINGLE_PRECISION
using Real = float;
#else
using Real = double;
#endif

/**
 * @brief Signed index type for tensor sizes, strides and offsets
 *
 * Negative indices in slicing selections count from the end.
 */
using Index = std::int64_t;

// ============================================================================
// Dimension Kinds
// ============================================================================

/**
 * @brief Kind tag of a named tensor dimension
 *
 * The enumerator order is the canonical dimension order of a Shape.
 */
enum class DimKind : std::uint8_t {
    Batch    = 0,  // Independent samples (batch of simulations)
    Dual     = 1,  // Dual dimensions, name starts with '~' (faces, matrix columns)
    Instance = 2,  // Unordered collections (particles, mesh cells)
    Spatial  = 3,  // Grid axes
    Channel  = 4   // Components (vector)
};

inline const char* dim_kind_to_string(DimKind kind) {
    switch (kind) {
        case DimKind::Batch:    return "batch";
        case DimKind::Dual:     return "dual";
        case DimKind::Instance: return "instance";
        case DimKind::Spatial:  return "spatial";
        case DimKind::Channel:  return "channel";
        default:                return "unknown";
    }
}

// ============================================================================
// Status Codes
// ============================================================================

/**
 * @brief Status codes attached to library exceptions
 */
enum class PFLStatus : std::uint8_t {
    Success                   = 0,
    InvalidArgument           = 1,
    ShapeMismatch             = 2,
    IncompatibleExtrapolation = 3,
    NotImplemented            = 4,
    OutOfRange                = 5,
    Unknown                   = 255
};

inline const char* status_to_string(PFLStatus status) {
    switch (status) {
        case PFLStatus::Success:                   return "Success";
        case PFLStatus::InvalidArgument:           return "Invalid argument";
        case PFLStatus::ShapeMismatch:             return "Shape mismatch";
        case PFLStatus::IncompatibleExtrapolation: return "Incompatible extrapolations";
        case PFLStatus::NotImplemented:            return "Not implemented";
        case PFLStatus::OutOfRange:                return "Out of range";
        default:                                   return "Unknown error";
    }
}

// ============================================================================
// Well-known Dimension Names
// ============================================================================

namespace dims {
inline const std::string VECTOR = "vector";
inline const std::string DUAL_VECTOR = "~vector";
inline const std::string CELLS = "cells";
inline const std::string VERTICES = "vertices";
inline const std::string DUAL_FACES = "~faces";
} // namespace dims

} // namespace pfl

#endif // PFL_CORE_TYPES_H
