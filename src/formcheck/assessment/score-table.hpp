#pragma once

#include <initializer_list>
#include <utility>

#include "formcheck/foundation.hpp"

namespace formcheck
{
// ------------------------------------------------------------------- Direction
//
enum class Direction : int8_t {
   LOWER_IS_BETTER = 0, // matches when `value <= hi`
   HIGHER_IS_BETTER,    // matches when `value >= lo`
   WITHIN_BAND          // matches when `lo <= value <= hi`
};

const char* str(const Direction) noexcept;

// ------------------------------------------------------------------- ScoreRule
//
struct ScoreRule
{
   Direction direction = Direction::LOWER_IS_BETTER;
   real lo             = 0.0;
   real hi             = 0.0;
   int subscore        = 0;

   bool matches(const real value) const noexcept;

   static ScoreRule at_most(real hi, int subscore) noexcept;
   static ScoreRule at_least(real lo, int subscore) noexcept;
   static ScoreRule within(real lo, real hi, int subscore) noexcept;

   string to_string() const noexcept;
};

// ------------------------------------------------------------------ ScoreTable
// An ordered list of rules, evaluated top-down. The first rule that matches
// gives the subscore, and `fallback` applies when none does.
struct ScoreTable
{
   vector<ScoreRule> rules;
   int fallback = 50;

   int evaluate(const real value) const noexcept;

   // Lowest and highest subscore the table can emit
   int min_subscore() const noexcept;
   int max_subscore() const noexcept;

   string to_string() const noexcept;
   friend string str(const ScoreTable& o) noexcept { return o.to_string(); }
};

// Convenience: `{{95.0, 95}, {110.0, 85}, ...}` with the given direction
ScoreTable make_lower_is_better(std::initializer_list<std::pair<real, int>> ll,
                                int fallback) noexcept;
ScoreTable make_higher_is_better(std::initializer_list<std::pair<real, int>> ll,
                                 int fallback) noexcept;

// ------------------------------------------------------------ weighted-overall
// lround(sum(weight * subscore)). The weights must sum to 1.0.
int weighted_overall(const vector<std::pair<int, real>>& subscore_weights)
    noexcept;

} // namespace formcheck
