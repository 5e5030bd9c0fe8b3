#pragma once

#include "analysis-result.hpp"
#include "score-table.hpp"

namespace formcheck
{
enum class SeverityPolicy : int8_t {
   GRADED = 0, // CRITICAL below 60, WARNING otherwise
   ALWAYS_INFO // mobility-type issues
};

// ----------------------------------------------------------------- MetricGroup
// One scored group: the summary stat that feeds it, the threshold table,
// its weight in the overall score, and the text templates.
struct MetricGroup
{
   string key;    // e.g., "depth"
   string metric; // name of the SummaryStat, e.g., "knee_flexion_p10"
   ScoreTable table;
   real weight           = 0.0;
   SeverityPolicy policy = SeverityPolicy::GRADED;
   int praise_at         = 80; // praised when subscore >= praise_at
   int correct_below     = 80; // corrected when subscore < correct_below

   string praise;
   string issue;
   string instruction;
   std::function<string(real)> breakdown; // stat => breakdown sentence
   std::function<string(real)> feedback;  // stat => correction sentence

   Severity severity_for(int subscore) const noexcept;
};

// ---------------------------------------------------------- ExerciseDefinition
//
struct ExerciseDefinition
{
   string name;
   vector<MetricGroup> groups; // breakdown and praise order
   vector<string> correction_order;
   vector<string> improvement_tips;
   string insufficient_message;

   const MetricGroup* find_group(const string_view key) const noexcept;

   real total_weight() const noexcept;
};

// ------------------------------------------------------------- assemble-result
// Scores every group against `metrics`, then builds the praise, the ordered
// corrections and the breakdown. A group whose metric is missing from
// `metrics` is scored on 0.0.
AnalysisResult assemble_result(const ExerciseDefinition& def,
                               const MetricSummaries& metrics) noexcept;

// Banded one-line verdict on the overall score
string summary_sentence(const int overall_score,
                        const size_t n_corrections) noexcept;

} // namespace formcheck
