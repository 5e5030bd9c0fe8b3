#include "analysis-result.hpp"

#include "formcheck/io/json-io.hpp"

#define This AnalysisResult

namespace formcheck
{
// -------------------------------------------------------------------- Severity
//
const char* str(const Severity x) noexcept
{
   switch(x) {
   case Severity::INFO: return "info";
   case Severity::WARNING: return "warning";
   case Severity::CRITICAL: return "critical";
   }
   return "<unknown>";
}

Severity to_severity(const string_view s) noexcept(false)
{
   const auto val = string_to_lowercase(trim_copy(s));
   if(val == "info") return Severity::INFO;
   if(val == "warning") return Severity::WARNING;
   if(val == "critical") return Severity::CRITICAL;
   throw std::runtime_error(format("could not convert '{}' to a Severity", s));
}

// -------------------------------------------------------------- CorrectionItem
//
Json::Value CorrectionItem::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["issue"]                  = issue;
   o["severity"]               = str(severity);
   o["feedback"]               = feedback;
   o["correction_instruction"] = correction_instruction;
   return o;
}

// ----------------------------------------------------------------- find-metric
//
std::optional<real> find_metric(const MetricSummaries& metrics,
                                const string_view name) noexcept
{
   auto ii = ranges::find_if(
       metrics, [name](const auto& kv) { return kv.first == name; });
   if(ii == cend(metrics)) return std::nullopt;
   return ii->second;
}

// -------------------------------------------------------------- AnalysisResult
//
const Subscore* This::find_subscore(const string_view group) const noexcept
{
   auto ii = ranges::find_if(
       breakdown, [group](const auto& s) { return s.group == group; });
   return (ii == cend(breakdown)) ? nullptr : &*ii;
}

const CorrectionItem* This::find_correction(const string_view issue) const
    noexcept
{
   auto ii = ranges::find_if(
       corrections, [issue](const auto& c) { return c.issue == issue; });
   return (ii == cend(corrections)) ? nullptr : &*ii;
}

Json::Value This::to_json() const noexcept
{
   auto string_array = [](const vector<string>& ss) {
      return json_save(cbegin(ss), cend(ss));
   };

   Json::Value o{Json::objectValue};
   o["success"]       = true;
   o["exercise_type"] = exercise;
   o["overall_score"] = overall_score;
   o["whats_right"]   = string_array(whats_right);

   Json::Value cc{Json::arrayValue};
   for(const auto& c : corrections) cc.append(c.to_json());
   o["corrections_needed"] = cc;

   Json::Value bd{Json::objectValue};
   for(const auto& s : breakdown) {
      Json::Value x{Json::objectValue};
      x["score"]    = s.score;
      x["feedback"] = s.feedback;
      bd[s.group]   = x;
   }
   o["detailed_breakdown"] = bd;
   o["improvement_tips"]   = string_array(improvement_tips);

   Json::Value mm{Json::objectValue};
   for(const auto& [name, value] : metrics) mm[name] = value;
   o["metrics"] = mm;

   o["frames_sampled"]     = frames_sampled;
   o["frames_used"]        = frames_used;
   o["overall_visibility"] = overall_visibility;
   if(summary.has_value()) o["summary"] = *summary;
   return o;
}

string This::to_string() const noexcept { return json_pretty_str(to_json()); }

} // namespace formcheck

#undef This
