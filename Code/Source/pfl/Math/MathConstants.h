/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_MATH_CONSTANTS_H
#define PFL_MATH_CONSTANTS_H

/**
 * @file MathConstants.h
 * @brief Mathematical constants used by geometry and operator code
 */

#include <type_traits>

namespace pfl {
namespace math {

template<typename T>
struct Constants {
    static_assert(std::is_floating_point_v<T>,
                  "Constants only defined for floating-point types");

    static constexpr T pi      = T(3.14159265358979323846264338327950288419716939937510L);
    static constexpr T two_pi  = T(6.28318530717958647692528676655900576839433879875021L);
    static constexpr T half_pi = T(1.57079632679489661923132169163975144209858469968755L);
};

namespace constants {

inline constexpr double PI     = Constants<double>::pi;
inline constexpr double TWO_PI = Constants<double>::two_pi;
inline constexpr double PI_2   = Constants<double>::half_pi;

} // namespace constants

} // namespace math
} // namespace pfl

#endif // PFL_MATH_CONSTANTS_H
