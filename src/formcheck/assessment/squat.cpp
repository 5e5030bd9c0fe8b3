#include "squat.hpp"

#include "formcheck/geometry/angles.hpp"
#include "formcheck/skeleton/side-selector.hpp"

#define This SquatModel

namespace formcheck
{
// ------------------------------------------------------------------ definition
//
static ExerciseDefinition make_squat_definition() noexcept
{
   ExerciseDefinition def;
   def.name = This::k_name;

   {
      MetricGroup g;
      g.key         = "depth";
      g.metric      = "knee_flexion_p10";
      g.table       = make_lower_is_better(
          {{95.0, 95}, {110.0, 85}, {125.0, 70}}, 50);
      g.weight      = 0.35;
      g.praise      = "Good squat depth.";
      g.issue       = "Shallow depth";
      g.instruction = "Try light heel elevation and tempo squats (3-0-3) to "
                      "build control.";
      g.breakdown   = [](real x) {
         return format("Deepest knee angle ≈ {:.0f}°.", x);
      };
      g.feedback = [](real x) {
         return format("Deepest knee angle {:.0f}° suggests limited depth.", x);
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "torso_alignment";
      g.metric      = "torso_lean_median";
      g.table       = make_lower_is_better(
          {{5.0, 95}, {10.0, 80}, {15.0, 65}}, 50);
      g.weight      = 0.30;
      g.praise      = "Solid torso control.";
      g.issue       = "Excessive torso lean";
      g.instruction = "Brace and keep chest and hips rising together; try "
                      "goblet squats.";
      g.breakdown   = [](real x) {
         return format("Median torso lean ≈ {:.0f}° from upright.", x);
      };
      g.feedback = [](real x) {
         return format("Torso lean ≈ {:.0f}° may stress the lower back.", x);
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "knee_tracking";
      g.metric      = "knee_deviation_p90";
      g.table       = make_lower_is_better(
          {{0.15, 95}, {0.25, 80}, {0.35, 65}}, 50);
      g.weight      = 0.25;
      g.praise      = "Knees tracking well.";
      g.issue       = "Knee valgus";
      g.instruction = "Screw feet into the floor and push knees over the "
                      "2nd-3rd toe; add mini-band warm-ups.";
      g.breakdown   = [](real x) {
         return format("Knee drift (norm) ≈ {:.2f}.", x);
      };
      g.feedback = [](real) {
         return "Knees show lateral drift vs toe line."s;
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "ankle_mobility";
      g.metric      = "ankle_dorsiflexion_p90";
      g.table       = make_higher_is_better(
          {{30.0, 95}, {20.0, 80}, {15.0, 65}}, 50);
      g.weight      = 0.10;
      g.policy      = SeverityPolicy::ALWAYS_INFO;
      g.praise      = "Adequate ankle mobility.";
      g.issue       = "Limited ankle mobility";
      g.instruction = "Elevate the heels slightly and add calf and ankle "
                      "mobility drills to the warm-up.";
      g.breakdown   = [](real x) {
         return format("Peak dorsiflexion proxy ≈ {:.0f}°.", x);
      };
      g.feedback = [](real x) {
         return format("Peak dorsiflexion proxy ≈ {:.0f}° limits how far the "
                       "knees can travel forward.",
                       x);
      };
      def.groups.push_back(std::move(g));
   }

   def.correction_order
       = {"knee_tracking", "depth", "torso_alignment", "ankle_mobility"};

   def.improvement_tips = {"Film from ~45° front, full body in frame.",
                           "Brace before descent; exhale on top.",
                           "Tripod foot pressure; slow 2-3s eccentric."};

   def.insufficient_message
       = "Not enough pose detections to analyze. Ensure full-body in frame "
         "and decent lighting.";

   return def;
}

const ExerciseDefinition& This::definition() noexcept
{
   static const ExerciseDefinition def = make_squat_definition();
   return def;
}

// ------------------------------------------------------------------ accumulate
//
bool This::accumulate(const PoseFrame& frame) noexcept
{
   const auto side = choose_leg_side(frame);
   auto at = [&](Joint j) { return frame.pixel(landmark_of(side, j)); };

   const auto shoulder = at(Joint::SHOULDER);
   const auto hip      = at(Joint::HIP);
   const auto knee     = at(Joint::KNEE);
   const auto ankle    = at(Joint::ANKLE);
   const auto toe      = at(Joint::TOE);

   const bool has_primary = knee_flexion.push(angle_at_vertex(hip, knee, ankle));
   hip_flexion.push(angle_at_vertex(shoulder, hip, knee));
   torso_lean.push(angle_to_vertical(hip, shoulder));

   if(const auto theta = angle_at_vertex(knee, ankle, toe); theta.has_value())
      dorsiflexion.push(180.0 - *theta);

   knee_deviation.push(safe_ratio(dist_point_to_line(knee, ankle, toe),
                                  segment_length(hip, knee)));

   if(hip.has_value() and knee.has_value())
      hip_below_knee.push(hip->y - knee->y);

   TRACE(format("squat frame {}, side = {}, knee = {}",
                frame.frame_no(),
                str(side),
                has_primary ? str(knee_flexion.values.back()) : "-"s));

   return has_primary;
}

// ------------------------------------------------------------------- summarize
//
MetricSummaries This::summarize() const noexcept
{
   MetricSummaries ret;
   for(const auto* s : {&knee_flexion,
                        &hip_flexion,
                        &torso_lean,
                        &dorsiflexion,
                        &knee_deviation,
                        &hip_below_knee})
      ret.emplace_back(s->name, s->summary());
   return ret;
}

AnalysisResult This::assess() const noexcept
{
   return assemble_result(definition(), summarize());
}

} // namespace formcheck

#undef This
