#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <functional>
#include <limits>

#include "string-utils.hpp"

namespace formcheck
{
constexpr double dNAN = std::numeric_limits<double>::quiet_NaN();

// ----------------------------------------------------------- Inclusive Between

template<typename T, class less_eq = std::less_equal<T>>
inline constexpr bool inclusive_between(const T low_bound,
                                        const T value,
                                        const T high_bound,
                                        less_eq leq = std::less_equal<T>{})
{
   return leq(value, high_bound) && leq(low_bound, value);
}

// ----------------------------------------------------------------------- Clamp

template<typename T> constexpr T clamp(T in, T min, T max) noexcept
{
   if(in < min) return min;
   if(in > max) return max;
   return in;
}

// ---------------------------------------------------------------------- Angles

template<std::floating_point T> inline constexpr T to_radians(T theta) noexcept
{
   return theta * (T(M_PI) / T(180.0));
}

template<std::floating_point T> inline constexpr T to_degrees(T theta) noexcept
{
   return theta * (T(180.0) / T(M_PI));
}

} // namespace formcheck
