#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/io/json-io.hpp"
#include "formcheck/pipeline/analyze.hpp"

#include "testcases/synthetic-poses.hpp"

static const bool feedback = false;

namespace formcheck
{
using namespace formcheck::testing;

static vector<std::optional<PoseFrame>> make_squat_rep()
{
   vector<std::optional<PoseFrame>> frames;
   for(const auto alpha : squat_rep_angles())
      frames.emplace_back(make_squat_frame(int(frames.size()) + 1, alpha));
   return frames;
}

static AnalysisParams every_frame_params()
{
   AnalysisParams p;
   p.frame_stride = 1;
   return p;
}

CATCH_TEST_CASE("AnalyzeExercise", "[analyze-exercise]")
{
   CATCH_SECTION("squat-with-knee-drift")
   {
      VectorPoseSource source{make_squat_rep()};
      const auto o = analyze_exercise("squat", source, every_frame_params());
      CATCH_REQUIRE(o.success());
      CATCH_REQUIRE(o.message.empty());
      CATCH_REQUIRE(o.result.has_value());

      const auto& r = *o.result;
      CATCH_REQUIRE(r.exercise == "squat");
      CATCH_REQUIRE(find_metric(r.metrics, "knee_flexion_p10").value()
                    == Approx(90.0));
      CATCH_REQUIRE(r.find_subscore("depth")->score == 95);
      CATCH_REQUIRE(r.find_subscore("knee_tracking")->score == 50);
      CATCH_REQUIRE(r.overall_score == 84);
      CATCH_REQUIRE(r.corrections.size() == 1);
      CATCH_REQUIRE(r.corrections[0].issue == "Knee valgus");
      CATCH_REQUIRE(r.corrections[0].severity == Severity::CRITICAL);
      CATCH_REQUIRE(r.frames_sampled == 30);
      CATCH_REQUIRE(r.frames_used == 30);
      CATCH_REQUIRE(r.overall_visibility == Approx(1.0));
      CATCH_REQUIRE(r.summary.has_value());
      CATCH_REQUIRE(*r.summary == "Good form with some areas for improvement.");

      CATCH_REQUIRE(source.n_open_calls == 1);
      CATCH_REQUIRE(source.n_close_calls >= 1);
      CATCH_REQUIRE(!source.is_open());

      const auto o_json = o.to_json();
      CATCH_REQUIRE(o_json["success"].asBool());
      CATCH_REQUIRE(o_json["exercise_type"].asString() == "squat");
      CATCH_REQUIRE(o_json["overall_score"].asInt() == 84);
      CATCH_REQUIRE(o_json["corrections_needed"].size() == 1);
      CATCH_REQUIRE(o_json["corrections_needed"][0]["severity"].asString()
                    == "critical");
      CATCH_REQUIRE(o_json["detailed_breakdown"]["depth"]["score"].asInt()
                    == 95);
      if(feedback) cout << str(o) << endl;
   }

   CATCH_SECTION("coincident-landmarks")
   {
      vector<std::optional<PoseFrame>> frames;
      for(int i = 1; i <= 10; ++i) {
         PoseFrame f{i, k_size, k_size};
         for(auto name : {L_HIP, L_KNEE, L_ANKLE, L_SHOULDER, L_TOE})
            f.set(name, make_landmark(0.5, 0.5));
         frames.emplace_back(std::move(f));
      }
      VectorPoseSource source{std::move(frames)};
      const auto o = analyze_exercise("squat", source, every_frame_params());
      CATCH_REQUIRE(!o.success());
      CATCH_REQUIRE(o.error == AnalysisError::INSUFFICIENT_EVIDENCE);
      CATCH_REQUIRE(o.message
                    == SquatModel::definition().insufficient_message);
      CATCH_REQUIRE(!o.result.has_value());
      CATCH_REQUIRE(source.n_close_calls >= 1);
      CATCH_REQUIRE(!source.is_open());

      const auto o_json = o.to_json();
      CATCH_REQUIRE(!o_json["success"].asBool());
      CATCH_REQUIRE(o_json["error"].asString() == o.message);
      CATCH_REQUIRE(o_json["error_kind"].asString()
                    == "INSUFFICIENT_EVIDENCE");
   }

   CATCH_SECTION("unsupported-exercise")
   {
      VectorPoseSource source{make_squat_rep()};
      const auto o = analyze_exercise("burpee", source, AnalysisParams{});
      CATCH_REQUIRE(o.error == AnalysisError::UNSUPPORTED_EXERCISE);
      CATCH_REQUIRE(o.message
                    == "Exercise 'burpee' not supported. Try 'squat', "
                       "'pushup' or 'lunge'.");
      CATCH_REQUIRE(source.n_open_calls == 0);
      CATCH_REQUIRE(source.n_advance_calls == 0);
      CATCH_REQUIRE(source.n_detect_calls == 0);
   }

   CATCH_SECTION("pushup")
   {
      vector<real> alphas;
      for(int i = 0; i < 10; ++i) alphas.push_back(160.0 - 80.0 * i / 10.0);
      for(int i = 0; i < 4; ++i) alphas.push_back(80.0);
      for(int i = 1; i <= 10; ++i) alphas.push_back(80.0 + 80.0 * i / 10.0);

      vector<std::optional<PoseFrame>> frames;
      for(const auto alpha : alphas)
         frames.emplace_back(make_pushup_frame(int(frames.size()) + 1, alpha));

      VectorPoseSource source{std::move(frames)};
      const auto o = analyze_exercise("Push-Up", source, every_frame_params());
      CATCH_REQUIRE(o.success());
      const auto& r = *o.result;
      CATCH_REQUIRE(r.exercise == "pushup");
      CATCH_REQUIRE(r.overall_score == 90);
      CATCH_REQUIRE(r.corrections.size() == 1);
      CATCH_REQUIRE(r.corrections[0].issue == "Hands not under shoulders");
      CATCH_REQUIRE(r.corrections[0].severity == Severity::WARNING);
      CATCH_REQUIRE(*r.summary
                    == "Excellent form! Minor adjustments can make it "
                       "perfect.");
      CATCH_REQUIRE(r.frames_used == 24);
   }

   CATCH_SECTION("no-summary")
   {
      VectorPoseSource source{make_squat_rep()};
      auto params         = every_frame_params();
      params.emit_summary = false;
      const auto o        = analyze_exercise("squat", source, params);
      CATCH_REQUIRE(o.success());
      CATCH_REQUIRE(!o.result->summary.has_value());
      CATCH_REQUIRE(!has_key(o.to_json(), "summary"));
   }
}

CATCH_TEST_CASE("AnalyzeSampling", "[analyze-sampling]")
{
   CATCH_SECTION("stride")
   {
      VectorPoseSource source{make_squat_rep()};
      const auto o = analyze_exercise("squat", source, AnalysisParams{});
      CATCH_REQUIRE(o.success());
      // Frames 3, 6, ..., 30
      CATCH_REQUIRE(o.result->frames_sampled == 10);
      CATCH_REQUIRE(source.n_detect_calls == 10);
      CATCH_REQUIRE(source.n_advance_calls == 31);
   }

   CATCH_SECTION("max-frames")
   {
      VectorPoseSource source{make_squat_rep()};
      auto params       = every_frame_params();
      params.max_frames = 4;
      const auto o      = analyze_exercise("squat", source, params);
      CATCH_REQUIRE(o.success());
      CATCH_REQUIRE(o.result->frames_sampled == 4);
      CATCH_REQUIRE(o.result->frames_used == 4);
      CATCH_REQUIRE(source.n_detect_calls == 4);
   }

   CATCH_SECTION("non-detections-are-sampled-not-used")
   {
      auto frames = make_squat_rep();
      for(size_t i = 0; i < frames.size(); i += 2) frames[i] = std::nullopt;
      VectorPoseSource source{std::move(frames)};
      const auto o = analyze_exercise("squat", source, every_frame_params());
      CATCH_REQUIRE(o.success());
      CATCH_REQUIRE(o.result->frames_sampled == 30);
      CATCH_REQUIRE(o.result->frames_used == 15);
   }

   CATCH_SECTION("detections-without-primary-metric-are-used")
   {
      // 5 extra frames with the hip on the knee: no knee angle, but the
      // torso and ankle metrics are still there
      auto frames = make_squat_rep();
      for(int i = 0; i < 5; ++i) {
         auto f = make_squat_frame(int(frames.size()) + 1, 120.0);
         f.set(L_HIP, make_landmark(0.5, 0.5, 0.5));
         frames.emplace_back(std::move(f));
      }
      VectorPoseSource source{std::move(frames)};
      const auto o = analyze_exercise("squat", source, every_frame_params());
      CATCH_REQUIRE(o.success());
      CATCH_REQUIRE(o.result->frames_sampled == 35);
      CATCH_REQUIRE(o.result->frames_used == 35);
      // 30 frames at visibility 1.0, and 5 at (4 * 1.0 + 0.5) / 5 = 0.9
      CATCH_REQUIRE(o.result->overall_visibility
                    == Approx((30.0 + 5.0 * 0.9) / 35.0));
   }

   CATCH_SECTION("min-usable-frames")
   {
      auto frames = make_squat_rep();
      frames.resize(4);
      VectorPoseSource source{std::move(frames)};
      auto params              = every_frame_params();
      params.min_usable_frames = 5;
      const auto o             = analyze_exercise("squat", source, params);
      CATCH_REQUIRE(o.error == AnalysisError::INSUFFICIENT_EVIDENCE);

      VectorPoseSource empty{vector<std::optional<PoseFrame>>{}};
      CATCH_REQUIRE(analyze_exercise("lunge", empty, AnalysisParams{}).error
                    == AnalysisError::INSUFFICIENT_EVIDENCE);
   }

   CATCH_SECTION("default-frame-size")
   {
      // The source cannot report its size, so 1920x1080 is used
      vector<std::optional<PoseFrame>> frames;
      for(int i = 1; i <= 5; ++i) frames.emplace_back(make_squat_frame(i, 60.0));
      VectorPoseSource source{std::move(frames)};
      source.set_size(0, 0);
      const auto o = analyze_exercise("squat", source, every_frame_params());
      CATCH_REQUIRE(o.success());
      CATCH_REQUIRE(find_metric(o.result->metrics, "hip_below_knee_p90").value()
                    == Approx(0.2 * 0.5 * 1080.0));
   }
}

CATCH_TEST_CASE("AnalyzeFailures", "[analyze-failures]")
{
   CATCH_SECTION("source-fails-to-open")
   {
      VectorPoseSource source{make_squat_rep(), true};
      const auto o = analyze_exercise("squat", source, AnalysisParams{});
      CATCH_REQUIRE(o.error == AnalysisError::DECODE_FAILURE);
      CATCH_REQUIRE(o.message == "Could not open video.");
      CATCH_REQUIRE(source.n_open_calls == 1);
      CATCH_REQUIRE(source.n_close_calls >= 1);
      CATCH_REQUIRE(source.n_advance_calls == 0);
   }

   CATCH_SECTION("source-throws-mid-stream")
   {
      VectorPoseSource source{make_squat_rep(), false, 7};
      const auto o = analyze_exercise("squat", source, every_frame_params());
      CATCH_REQUIRE(o.error == AnalysisError::DECODE_FAILURE);
      CATCH_REQUIRE(!o.result.has_value());
      CATCH_REQUIRE(source.n_advance_calls == 7);
      CATCH_REQUIRE(source.n_close_calls >= 1);
      CATCH_REQUIRE(!source.is_open());
   }

   CATCH_SECTION("source-throws-on-open")
   {
      VectorPoseSource source{make_squat_rep(), false, 0, true};
      const auto o = analyze_exercise("squat", source, every_frame_params());
      CATCH_REQUIRE(o.error == AnalysisError::DECODE_FAILURE);
      CATCH_REQUIRE(o.message == "Could not open video.");
      CATCH_REQUIRE(source.n_open_calls == 1);
      CATCH_REQUIRE(source.n_close_calls >= 1);
      CATCH_REQUIRE(!source.is_open());
      CATCH_REQUIRE(source.n_advance_calls == 0);
   }

   CATCH_SECTION("session-closes-when-open-throws")
   {
      VectorPoseSource source{make_squat_rep(), false, 0, true};
      CATCH_REQUIRE_THROWS(PoseSession{source});
      CATCH_REQUIRE(source.n_close_calls == 1);
      CATCH_REQUIRE(!source.is_open());
   }

   CATCH_SECTION("invalid-params")
   {
      VectorPoseSource source{make_squat_rep()};
      AnalysisParams params;
      params.frame_stride = 0;
      const auto o        = analyze_exercise("squat", source, params);
      CATCH_REQUIRE(o.error == AnalysisError::INVALID_PARAMS);
      CATCH_REQUIRE(source.n_open_calls == 0);
   }

   CATCH_SECTION("error-kind-names")
   {
      for(auto e : {AnalysisError::NONE,
                    AnalysisError::DECODE_FAILURE,
                    AnalysisError::INSUFFICIENT_EVIDENCE,
                    AnalysisError::UNSUPPORTED_EXERCISE,
                    AnalysisError::INVALID_PARAMS})
         CATCH_REQUIRE(to_analysis_error(str(e)) == e);
      CATCH_REQUIRE_THROWS(to_analysis_error("TIMEOUT"));
   }
}

} // namespace formcheck
