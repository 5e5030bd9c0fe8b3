#pragma once

#include "formcheck/foundation.hpp"

namespace Json
{
class Value;
}

namespace formcheck
{
// -------------------------------------------------------------------- Severity
//
enum class Severity : int8_t { INFO = 0, WARNING, CRITICAL };

const char* str(const Severity) noexcept;
Severity to_severity(const string_view) noexcept(false);

// -------------------------------------------------------------- CorrectionItem
//
struct CorrectionItem
{
   string issue;
   Severity severity = Severity::WARNING;
   string feedback;
   string correction_instruction;

   Json::Value to_json() const noexcept;
};

// -------------------------------------------------------------------- Subscore
//
struct Subscore
{
   string group;
   int score = 0;
   string feedback;
};

// One SummaryStat per metric name, in extraction order
using MetricSummaries = vector<std::pair<string, real>>;

// nullopt if `name` is not in `metrics`
std::optional<real> find_metric(const MetricSummaries& metrics,
                                const string_view name) noexcept;

// -------------------------------------------------------------- AnalysisResult
//
struct AnalysisResult
{
   string exercise;
   int overall_score = 0;
   vector<string> whats_right;
   vector<CorrectionItem> corrections;
   vector<Subscore> breakdown; // one per metric group
   vector<string> improvement_tips;
   MetricSummaries metrics;

   int frames_sampled      = 0; // sampled, whether or not a pose was found
   int frames_used         = 0; // sampled frames where a pose was found
   real overall_visibility = 0.0; // mean over the used frames
   std::optional<string> summary;

   const Subscore* find_subscore(const string_view group) const noexcept;
   const CorrectionItem* find_correction(const string_view issue) const
       noexcept;

   Json::Value to_json() const noexcept;
   string to_string() const noexcept; // pretty-printed json
   friend string str(const AnalysisResult& o) noexcept
   {
      return o.to_string();
   }
};

} // namespace formcheck
