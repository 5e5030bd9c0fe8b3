#include "feedback.hpp"

namespace formcheck
{
// ----------------------------------------------------------------- MetricGroup
//
Severity MetricGroup::severity_for(int subscore) const noexcept
{
   if(policy == SeverityPolicy::ALWAYS_INFO) return Severity::INFO;
   return (subscore < 60) ? Severity::CRITICAL : Severity::WARNING;
}

// ---------------------------------------------------------- ExerciseDefinition
//
const MetricGroup* ExerciseDefinition::find_group(const string_view key) const
    noexcept
{
   auto ii
       = ranges::find_if(groups, [key](const auto& g) { return g.key == key; });
   return (ii == cend(groups)) ? nullptr : &*ii;
}

real ExerciseDefinition::total_weight() const noexcept
{
   return ranges::accumulate(
       groups | views::transform([](const auto& g) { return g.weight; }), 0.0);
}

// ------------------------------------------------------------- assemble-result
//
AnalysisResult assemble_result(const ExerciseDefinition& def,
                               const MetricSummaries& metrics) noexcept
{
   AnalysisResult ret;
   ret.exercise         = def.name;
   ret.metrics          = metrics;
   ret.improvement_tips = def.improvement_tips;

   const auto stats = def.groups | views::transform([&](const auto& g) {
                         return find_metric(metrics, g.metric).value_or(0.0);
                      })
                      | ranges::to<vector<real>>();

   vector<int> scores;
   vector<std::pair<int, real>> weighted;
   scores.reserve(def.groups.size());
   for(size_t i = 0; i < def.groups.size(); ++i) {
      const auto& g = def.groups[i];
      scores.push_back(g.table.evaluate(stats[i]));
      weighted.emplace_back(scores.back(), g.weight);
   }

   // -- Overall
   ret.overall_score = weighted_overall(weighted);

   // -- Breakdown and praise, in group order
   for(size_t i = 0; i < def.groups.size(); ++i) {
      const auto& g = def.groups[i];
      ret.breakdown.push_back(
          {g.key, scores[i], g.breakdown ? g.breakdown(stats[i]) : ""s});
      if(scores[i] >= g.praise_at) ret.whats_right.push_back(g.praise);
   }

   // -- Corrections, in priority order
   for(const auto& key : def.correction_order) {
      auto ii = ranges::find_if(def.groups,
                                [&](const auto& g) { return g.key == key; });
      Expects(ii != cend(def.groups));
      const auto i  = size_t(std::distance(cbegin(def.groups), ii));
      const auto& g = *ii;
      if(scores[i] >= g.correct_below) continue;
      CorrectionItem c;
      c.issue                  = g.issue;
      c.severity               = g.severity_for(scores[i]);
      c.feedback               = g.feedback ? g.feedback(stats[i]) : ""s;
      c.correction_instruction = g.instruction;
      ret.corrections.push_back(std::move(c));
   }

   return ret;
}

// ------------------------------------------------------------ summary-sentence
//
string summary_sentence(const int overall_score,
                        const size_t n_corrections) noexcept
{
   if(overall_score >= 90)
      return "Excellent form! Minor adjustments can make it perfect.";
   if(overall_score >= 80) return "Good form with some areas for improvement.";
   if(overall_score >= 70) return "Fair form. Focus on the corrections below.";
   return format("Needs work. Focus on these {} key areas to improve safety "
                 "and effectiveness.",
                 n_corrections);
}

} // namespace formcheck
