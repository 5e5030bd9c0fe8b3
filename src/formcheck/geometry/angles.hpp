#pragma once

#include "vector-2.hpp"

namespace formcheck
{
// All functions operate on pixel-space points, return degrees (or pixels),
// and return std::nullopt when the geometry is degenerate: a zero length
// ray or line, or a non-finite input.

// Angle at vertex `b` between rays b->a and b->c. In [0..180].
std::optional<real>
angle_at_vertex(const Vector2& a, const Vector2& b, const Vector2& c) noexcept;

// Angle between the vector b->a and the downward image vertical (0, 1).
// 0 when `a` is directly below `b`, 180 when directly above.
std::optional<real> angle_to_vertical(const Vector2& a,
                                      const Vector2& b) noexcept;

// Angle between the vector b->a and the image horizontal (1, 0). In [0..180].
std::optional<real> angle_to_horizontal(const Vector2& a,
                                        const Vector2& b) noexcept;

// Perpendicular distance from `p` to the infinite line through `a` and `b`.
std::optional<real> dist_point_to_line(const Vector2& p,
                                       const Vector2& a,
                                       const Vector2& b) noexcept;

// Euclidean distance between two points.
std::optional<real> segment_length(const Vector2& a,
                                   const Vector2& b) noexcept;

// `numerator / denominator`, or nullopt if either is absent or the
// denominator is zero.
std::optional<real> safe_ratio(const std::optional<real>& numerator,
                               const real denominator) noexcept;
std::optional<real> safe_ratio(const std::optional<real>& numerator,
                               const std::optional<real>& denominator) noexcept;

// ------------------------------------------------------------ optional points
// As above, and nullopt when any point is absent.

using OptVector2 = std::optional<Vector2>;

std::optional<real> angle_at_vertex(const OptVector2& a,
                                    const OptVector2& b,
                                    const OptVector2& c) noexcept;
std::optional<real> angle_to_vertical(const OptVector2& a,
                                      const OptVector2& b) noexcept;
std::optional<real> angle_to_horizontal(const OptVector2& a,
                                        const OptVector2& b) noexcept;
std::optional<real> dist_point_to_line(const OptVector2& p,
                                       const OptVector2& a,
                                       const OptVector2& b) noexcept;
std::optional<real> segment_length(const OptVector2& a,
                                   const OptVector2& b) noexcept;

} // namespace formcheck
