#pragma once

#include "formcheck/foundation.hpp"

namespace Json
{
class Value;
}

namespace formcheck
{
// ----------------------------------------------------------------- SummaryKind
//
enum class SummaryKind : int8_t {
   MEDIAN = 0, // central tendency over the whole set
   P10,        // "deepest" of a flexion angle
   P90,        // "peak" of a deviation or mobility metric
   STDDEV      // jitter
};

const char* str(const SummaryKind) noexcept;
SummaryKind to_summary_kind(const string_view) noexcept(false);

// ----------------------------------------------------------------- percentiles
// Linear interpolation between closest ranks, with `p` in [0..100]. The
// input order is irrelevant. Returns 0.0 for an empty sequence.
real calc_percentile(const vector<real>& values, const real p) noexcept;
real calc_median(const vector<real>& values) noexcept;

// Population standard deviation (divide by N). 0.0 for an empty sequence.
real calc_stddev(const vector<real>& values) noexcept;

real summarize(const SummaryKind kind, const vector<real>& values) noexcept;

// ---------------------------------------------------------------- MetricSeries
// The per-frame values of one named metric, in frame order. Absent values
// are never appended.
struct MetricSeries
{
   string name;
   SummaryKind kind = SummaryKind::MEDIAN;
   vector<real> values;

   MetricSeries() = default;
   MetricSeries(string_view name_, SummaryKind kind_)
       : name(name_)
       , kind(kind_)
   {}

   // Returns TRUE iff the value was appended
   bool push(const std::optional<real>& value) noexcept;

   size_t size() const noexcept { return values.size(); }
   bool empty() const noexcept { return values.empty(); }

   // The SummaryStat. An empty series summarizes to 0.0
   real summary() const noexcept { return summarize(kind, values); }

   string to_string() const noexcept;
   friend string str(const MetricSeries& o) noexcept { return o.to_string(); }
};

} // namespace formcheck
