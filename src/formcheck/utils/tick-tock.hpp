#pragma once

#include <chrono>
#include <cmath>
#include <string>

#include "fmt/format.h"

namespace formcheck
{
inline std::chrono::time_point<std::chrono::steady_clock> tick() noexcept
{
   return std::chrono::steady_clock::now();
}

inline double
tock(const std::chrono::time_point<std::chrono::steady_clock>& whence) noexcept
{
   using ss = std::chrono::duration<double, std::ratio<1, 1>>;
   return std::chrono::duration_cast<ss>(tick() - whence).count();
}

inline std::string ms_tock_s(
    const std::chrono::time_point<std::chrono::steady_clock>& whence) noexcept
{
   return fmt::format("{:7.3f}",
                      std::round(tock(whence) * 1000000.0) * 0.001);
}

} // namespace formcheck
