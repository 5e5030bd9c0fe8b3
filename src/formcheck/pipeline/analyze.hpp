#pragma once

#include "analysis-params.hpp"

#include "formcheck/assessment/analysis-result.hpp"

namespace formcheck
{
class PoseFrameSource;

// --------------------------------------------------------------- AnalysisError
//
enum class AnalysisError : int8_t {
   NONE = 0,
   DECODE_FAILURE,        // the source could not be opened or read
   INSUFFICIENT_EVIDENCE, // too few frames with a primary metric
   UNSUPPORTED_EXERCISE,
   INVALID_PARAMS         // AnalysisParams::validate() failed
};

const char* str(const AnalysisError) noexcept;
AnalysisError to_analysis_error(const string_view) noexcept(false);

// ------------------------------------------------------------- AnalysisOutcome
//
struct AnalysisOutcome
{
   AnalysisError error = AnalysisError::NONE;
   string message; // human readable, empty on success
   std::optional<AnalysisResult> result;

   bool success() const noexcept { return error == AnalysisError::NONE; }

   static AnalysisOutcome make_error(AnalysisError error, string message);

   // {"success": true, ...result} or {"success": false, "error", "error_kind"}
   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const AnalysisOutcome& o) noexcept
   {
      return o.to_string();
   }
};

// ------------------------------------------------------------ analyze-exercise
// Samples `source` (every `frame_stride` frame, at most `max_frames`),
// extracts per-frame metrics for `exercise`, and scores them. The source is
// opened for the duration of the call and closed on every path. An
// unsupported exercise is reported before the source is touched. Never
// throws; every failure is an AnalysisOutcome.
AnalysisOutcome analyze_exercise(const string_view exercise,
                                 PoseFrameSource& source,
                                 const AnalysisParams& params) noexcept;

} // namespace formcheck
