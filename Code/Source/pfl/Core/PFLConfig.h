/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_CORE_CONFIG_H
#define PFL_CORE_CONFIG_H

/**
 * @file PFLConfig.h
 * @brief Compile-time configuration for the field library
 *
 * Centralizes build-mode detection, optional MPI support and the numeric
 * constants shared by sampling and geometry code. Settings can be
 * overridden via CMake or compiler flags.
 */

#include "Types.h"

// ============================================================================
// Build Configuration Detection
// ============================================================================

#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define PFL_DEBUG_MODE 1
#else
    #define PFL_DEBUG_MODE 0
#endif

// MPI is only used to tag log lines and exceptions with the rank.
#ifdef PFL_HAS_MPI
#  undef PFL_HAS_MPI
#endif
#if defined(PFL_ENABLE_MPI)
#  define PFL_HAS_MPI 1
#else
#  define PFL_HAS_MPI 0
#endif

namespace pfl {
namespace config {

// ============================================================================
// Numeric Tolerances
// ============================================================================

/**
 * @brief Relative tolerance of math::close()
 */
#ifndef PFL_CLOSE_RTOL
    constexpr Real CLOSE_RTOL = Real(1e-5);
#else
    constexpr Real CLOSE_RTOL = PFL_CLOSE_RTOL;
#endif

/**
 * @brief Absolute tolerance of math::close()
 */
#ifndef PFL_CLOSE_ATOL
    constexpr Real CLOSE_ATOL = Real(1e-8);
#else
    constexpr Real CLOSE_ATOL = PFL_CLOSE_ATOL;
#endif

/**
 * @brief Lower clamp of the squared center distance, relative to the radius
 *
 * Keeps the signed-distance gradient of spheres finite at the center.
 */
constexpr Real SDF_CENTER_CLAMP = Real(1e-2);

/// Epsilon used when normalizing radial directions
constexpr Real NORMALIZE_EPSILON = Real(1e-5);

/// Maximum spatial rank supported by rotations and meshes
constexpr int MAX_SPATIAL_DIM = 3;

} // namespace config
} // namespace pfl

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define PFL_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define PFL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define PFL_LIKELY(x)   (x)
    #define PFL_UNLIKELY(x) (x)
#endif

#if defined(_MSC_VER)
    #define PFL_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
    #define PFL_ALWAYS_INLINE __attribute__((always_inline)) inline
#else
    #define PFL_ALWAYS_INLINE inline
#endif

#endif // PFL_CORE_CONFIG_H
