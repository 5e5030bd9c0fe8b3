#include "score-table.hpp"

#include "formcheck/utils/math.hpp"

namespace formcheck
{
const char* str(const Direction x) noexcept
{
   switch(x) {
#define E(x) \
   case Direction::x: return #x;
      E(LOWER_IS_BETTER);
      E(HIGHER_IS_BETTER);
      E(WITHIN_BAND);
#undef E
   }
   return "<unknown>";
}

// ------------------------------------------------------------------- ScoreRule
//
bool ScoreRule::matches(const real value) const noexcept
{
   if(!std::isfinite(value)) return false;
   switch(direction) {
   case Direction::LOWER_IS_BETTER: return value <= hi;
   case Direction::HIGHER_IS_BETTER: return value >= lo;
   case Direction::WITHIN_BAND: return inclusive_between(lo, value, hi);
   }
   return false;
}

ScoreRule ScoreRule::at_most(real hi, int subscore) noexcept
{
   ScoreRule r;
   r.direction = Direction::LOWER_IS_BETTER;
   r.hi        = hi;
   r.subscore  = subscore;
   return r;
}

ScoreRule ScoreRule::at_least(real lo, int subscore) noexcept
{
   ScoreRule r;
   r.direction = Direction::HIGHER_IS_BETTER;
   r.lo        = lo;
   r.subscore  = subscore;
   return r;
}

ScoreRule ScoreRule::within(real lo, real hi, int subscore) noexcept
{
   Expects(lo <= hi);
   ScoreRule r;
   r.direction = Direction::WITHIN_BAND;
   r.lo        = lo;
   r.hi        = hi;
   r.subscore  = subscore;
   return r;
}

string ScoreRule::to_string() const noexcept
{
   switch(direction) {
   case Direction::LOWER_IS_BETTER: return format("<= {} : {}", hi, subscore);
   case Direction::HIGHER_IS_BETTER: return format(">= {} : {}", lo, subscore);
   case Direction::WITHIN_BAND:
      return format("[{}, {}] : {}", lo, hi, subscore);
   }
   return "<unknown>";
}

// ------------------------------------------------------------------ ScoreTable
//
int ScoreTable::evaluate(const real value) const noexcept
{
   auto ii = ranges::find_if(
       rules, [value](const auto& rule) { return rule.matches(value); });
   return (ii == cend(rules)) ? fallback : ii->subscore;
}

int ScoreTable::min_subscore() const noexcept
{
   int ret = fallback;
   for(const auto& rule : rules) ret = std::min(ret, rule.subscore);
   return ret;
}

int ScoreTable::max_subscore() const noexcept
{
   int ret = fallback;
   for(const auto& rule : rules) ret = std::max(ret, rule.subscore);
   return ret;
}

string ScoreTable::to_string() const noexcept
{
   return format("{{{}, else : {}}}",
                 implode(cbegin(rules),
                         cend(rules),
                         ", ",
                         [](const auto& r) { return r.to_string(); }),
                 fallback);
}

ScoreTable make_lower_is_better(std::initializer_list<std::pair<real, int>> ll,
                                int fallback) noexcept
{
   ScoreTable t;
   t.fallback = fallback;
   for(const auto& [hi, score] : ll)
      t.rules.push_back(ScoreRule::at_most(hi, score));
   return t;
}

ScoreTable make_higher_is_better(std::initializer_list<std::pair<real, int>> ll,
                                 int fallback) noexcept
{
   ScoreTable t;
   t.fallback = fallback;
   for(const auto& [lo, score] : ll)
      t.rules.push_back(ScoreRule::at_least(lo, score));
   return t;
}

// ------------------------------------------------------------ weighted-overall
//
int weighted_overall(const vector<std::pair<int, real>>& subscore_weights)
    noexcept
{
   real sum_w = 0.0;
   real total = 0.0;
   for(const auto& [subscore, weight] : subscore_weights) {
      sum_w += weight;
      total += weight * real(subscore);
   }
   Expects(std::fabs(sum_w - 1.0) < 1e-9);
   return int(std::lround(total));
}

} // namespace formcheck
