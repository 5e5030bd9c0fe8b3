#include "analyze.hpp"

#include "formcheck/assessment/exercise.hpp"
#include "formcheck/io/json-io.hpp"
#include "formcheck/pose-source/pose-frame-source.hpp"
#include "formcheck/utils/tick-tock.hpp"

namespace formcheck
{
// --------------------------------------------------------------- AnalysisError
//
const char* str(const AnalysisError x) noexcept
{
   switch(x) {
#define E(x) \
   case AnalysisError::x: return #x;
      E(NONE);
      E(DECODE_FAILURE);
      E(INSUFFICIENT_EVIDENCE);
      E(UNSUPPORTED_EXERCISE);
      E(INVALID_PARAMS);
#undef E
   }
   return "<unknown>";
}

AnalysisError to_analysis_error(const string_view val) noexcept(false)
{
#define E(x) \
   if(val == #x) return AnalysisError::x;
   E(NONE);
   E(DECODE_FAILURE);
   E(INSUFFICIENT_EVIDENCE);
   E(UNSUPPORTED_EXERCISE);
   E(INVALID_PARAMS);
#undef E
   throw std::runtime_error(
       format("could not convert '{}' to an AnalysisError", val));
}

// ------------------------------------------------------------- AnalysisOutcome
//
AnalysisOutcome AnalysisOutcome::make_error(AnalysisError error,
                                            string message)
{
   Expects(error != AnalysisError::NONE);
   AnalysisOutcome o;
   o.error   = error;
   o.message = std::move(message);
   return o;
}

Json::Value AnalysisOutcome::to_json() const noexcept
{
   if(success() and result.has_value()) return result->to_json();
   Json::Value o{Json::objectValue};
   o["success"]    = false;
   o["error"]      = message;
   o["error_kind"] = str(error);
   return o;
}

string AnalysisOutcome::to_string() const noexcept
{
   return json_pretty_str(to_json());
}

// ------------------------------------------------------------------- run-model
//
namespace detail
{
   struct SamplingStats
   {
      int frames_sampled  = 0;
      int frames_used     = 0;
      real sum_visibility  = 0.0;
   };

   template<typename Model>
   static SamplingStats run_model(Model& model,
                                  PoseFrameSource& source,
                                  const AnalysisParams& params) noexcept(false)
   {
      SamplingStats stats;

      const int w = (source.frame_width() > 0) ? source.frame_width()
                                               : params.default_frame_width;
      const int h = (source.frame_height() > 0) ? source.frame_height()
                                                : params.default_frame_height;

      int idx = 0;
      while(source.advance()) {
         ++idx;
         if(idx % params.frame_stride != 0) continue;
         if(stats.frames_sampled >= params.max_frames) break;
         ++stats.frames_sampled;

         const auto frame = source.detect(w, h);
         if(!frame.has_value()) {
            TRACE(format("frame {}: no pose detected", source.frame_no()));
            continue;
         }

         ++stats.frames_used;
         stats.sum_visibility += frame->overall_visibility();
         if(!model.accumulate(*frame)) {
            TRACE(format("frame {}: no primary metric", source.frame_no()));
         }
      }

      return stats;
   }
} // namespace detail

// ------------------------------------------------------------ analyze-exercise
//
AnalysisOutcome analyze_exercise(const string_view exercise,
                                 PoseFrameSource& source,
                                 const AnalysisParams& params) noexcept
{
   const auto kind = parse_exercise(exercise);
   if(!kind.has_value()) {
      WARN(format("unsupported exercise '{}'", exercise));
      return AnalysisOutcome::make_error(
          AnalysisError::UNSUPPORTED_EXERCISE,
          format("Exercise '{}' not supported. Try {}.",
                 exercise,
                 supported_exercises_str()));
   }

   const auto& def       = definition_of(*kind);
   const auto decode_err = [&]() {
      return AnalysisOutcome::make_error(AnalysisError::DECODE_FAILURE,
                                         "Could not open video."s);
   };

   try {
      params.validate();
   } catch(std::runtime_error& e) {
      LOG_ERR(format("invalid analysis parameters: {}", e.what()));
      return AnalysisOutcome::make_error(
          AnalysisError::INVALID_PARAMS,
          format("Invalid analysis parameters: {}.", e.what()));
   }

   try {
      const auto now = tick();
      auto model     = make_exercise_model(*kind);

      PoseSession session{source};
      if(!session.is_open()) {
         WARN(format("{}: failed to open the pose source", def.name));
         return decode_err();
      }

      const auto stats = std::visit(
          [&](auto& m) { return detail::run_model(m, source, params); },
          model);

      const auto n_primary
          = std::visit([](const auto& m) { return m.n_primary(); }, model);

      if(n_primary < size_t(params.min_usable_frames)) {
         WARN(format("{}: insufficient evidence, {} of {} sampled frames "
                     "usable, need {}",
                     def.name,
                     n_primary,
                     stats.frames_sampled,
                     params.min_usable_frames));
         return AnalysisOutcome::make_error(AnalysisError::INSUFFICIENT_EVIDENCE,
                                            def.insufficient_message);
      }

      AnalysisOutcome ret;
      ret.result = std::visit([](const auto& m) { return m.assess(); }, model);
      auto& result              = *ret.result;
      result.frames_sampled     = stats.frames_sampled;
      result.frames_used        = stats.frames_used;
      result.overall_visibility = (stats.frames_used > 0)
                                      ? stats.sum_visibility
                                            / real(stats.frames_used)
                                      : 0.0;
      if(params.emit_summary)
         result.summary = summary_sentence(result.overall_score,
                                           result.corrections.size());

      INFO(format("{}: score {}, {} frames sampled, {} used, {}ms",
                  def.name,
                  result.overall_score,
                  result.frames_sampled,
                  result.frames_used,
                  ms_tock_s(now)));

      return ret;
   } catch(std::exception& e) {
      WARN(format("{}: analysis failed: {}", def.name, e.what()));
   }

   return decode_err();
}

} // namespace formcheck
