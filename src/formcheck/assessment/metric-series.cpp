#include "metric-series.hpp"

#include <Eigen/Core>

#include "formcheck/utils/math.hpp"

namespace formcheck
{
// ----------------------------------------------------------------- SummaryKind
//
const char* str(const SummaryKind x) noexcept
{
   switch(x) {
#define E(x) \
   case SummaryKind::x: return #x;
      E(MEDIAN);
      E(P10);
      E(P90);
      E(STDDEV);
#undef E
   }
   return "<unknown>";
}

SummaryKind to_summary_kind(const string_view val) noexcept(false)
{
#define E(x) \
   if(val == #x) return SummaryKind::x;
   E(MEDIAN);
   E(P10);
   E(P90);
   E(STDDEV);
#undef E
   throw std::runtime_error(
       format("could not convert '{}' to a SummaryKind", val));
}

// ----------------------------------------------------------------- percentiles
//
real calc_percentile(const vector<real>& values, const real p) noexcept
{
   if(values.empty()) return 0.0;

   auto sorted = values;
   ranges::sort(sorted);

   const auto N    = sorted.size();
   const real rank = clamp(p, 0.0, 100.0) / 100.0 * real(N - 1);
   const auto lo   = size_t(std::floor(rank));
   const auto hi   = std::min(lo + 1, N - 1);
   const real frac = rank - real(lo);
   return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

real calc_median(const vector<real>& values) noexcept
{
   return calc_percentile(values, 50.0);
}

real calc_stddev(const vector<real>& values) noexcept
{
   if(values.empty()) return 0.0;
   const auto X = Eigen::Map<const Eigen::VectorXd>(values.data(),
                                                     Eigen::Index(values.size()));
   const real mean = X.mean();
   return std::sqrt((X.array() - mean).square().mean());
}

real summarize(const SummaryKind kind, const vector<real>& values) noexcept
{
   switch(kind) {
   case SummaryKind::MEDIAN: return calc_median(values);
   case SummaryKind::P10: return calc_percentile(values, 10.0);
   case SummaryKind::P90: return calc_percentile(values, 90.0);
   case SummaryKind::STDDEV: return calc_stddev(values);
   }
   return 0.0;
}

// ---------------------------------------------------------------- MetricSeries
//
bool MetricSeries::push(const std::optional<real>& value) noexcept
{
   if(!value.has_value() or !std::isfinite(*value)) return false;
   values.push_back(*value);
   return true;
}

string MetricSeries::to_string() const noexcept
{
   return format("{}[{}, n={}] = {}", name, str(kind), size(), summary());
}

} // namespace formcheck
