#include "angles.hpp"

#include "formcheck/utils/math.hpp"

namespace formcheck
{
// ---------------------------------------------------------- angle-between-rays
//
static std::optional<real> angle_between(const Vector2& u,
                                         const Vector2& v) noexcept
{
   if(!u.is_finite() or !v.is_finite()) return std::nullopt;
   const auto nu = u.norm();
   const auto nv = v.norm();
   if(nu == 0.0 or nv == 0.0) return std::nullopt;
   const auto cos_theta = clamp(u.dot(v) / (nu * nv), -1.0, 1.0);
   return to_degrees(std::acos(cos_theta));
}

// ------------------------------------------------------------- angle-at-vertex
//
std::optional<real>
angle_at_vertex(const Vector2& a, const Vector2& b, const Vector2& c) noexcept
{
   return angle_between(a - b, c - b);
}

// ----------------------------------------------------------- angle-to-vertical
//
std::optional<real> angle_to_vertical(const Vector2& a,
                                      const Vector2& b) noexcept
{
   return angle_between(a - b, Vector2{0.0, 1.0});
}

std::optional<real> angle_to_horizontal(const Vector2& a,
                                        const Vector2& b) noexcept
{
   return angle_between(a - b, Vector2{1.0, 0.0});
}

// ---------------------------------------------------------- dist-point-to-line
//
std::optional<real> dist_point_to_line(const Vector2& p,
                                       const Vector2& a,
                                       const Vector2& b) noexcept
{
   if(!p.is_finite() or !a.is_finite() or !b.is_finite()) return std::nullopt;
   const auto ab    = b - a;
   const auto denom = ab.norm();
   if(denom == 0.0) return std::nullopt;
   return std::fabs(ab.perp_dot(p - a)) / denom;
}

// -------------------------------------------------------------- segment-length
//
std::optional<real> segment_length(const Vector2& a,
                                   const Vector2& b) noexcept
{
   if(!a.is_finite() or !b.is_finite()) return std::nullopt;
   return (a - b).norm();
}

// ------------------------------------------------------------------ safe-ratio
//
std::optional<real> safe_ratio(const std::optional<real>& numerator,
                               const real denominator) noexcept
{
   if(!numerator.has_value()) return std::nullopt;
   if(!std::isfinite(denominator) or denominator == 0.0) return std::nullopt;
   return *numerator / denominator;
}

std::optional<real> safe_ratio(const std::optional<real>& numerator,
                               const std::optional<real>& denominator) noexcept
{
   if(!denominator.has_value()) return std::nullopt;
   return safe_ratio(numerator, *denominator);
}

// ------------------------------------------------------------ optional points
//
std::optional<real> angle_at_vertex(const OptVector2& a,
                                    const OptVector2& b,
                                    const OptVector2& c) noexcept
{
   if(!a or !b or !c) return std::nullopt;
   return angle_at_vertex(*a, *b, *c);
}

std::optional<real> angle_to_vertical(const OptVector2& a,
                                      const OptVector2& b) noexcept
{
   if(!a or !b) return std::nullopt;
   return angle_to_vertical(*a, *b);
}

std::optional<real> angle_to_horizontal(const OptVector2& a,
                                        const OptVector2& b) noexcept
{
   if(!a or !b) return std::nullopt;
   return angle_to_horizontal(*a, *b);
}

std::optional<real> dist_point_to_line(const OptVector2& p,
                                       const OptVector2& a,
                                       const OptVector2& b) noexcept
{
   if(!p or !a or !b) return std::nullopt;
   return dist_point_to_line(*p, *a, *b);
}

std::optional<real> segment_length(const OptVector2& a,
                                   const OptVector2& b) noexcept
{
   if(!a or !b) return std::nullopt;
   return segment_length(*a, *b);
}

} // namespace formcheck
