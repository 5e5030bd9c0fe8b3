#include "lunge.hpp"

#include "formcheck/geometry/angles.hpp"
#include "formcheck/skeleton/side-selector.hpp"

#define This LungeModel

namespace formcheck
{
// ------------------------------------------------------------------ definition
//
static ExerciseDefinition make_lunge_definition() noexcept
{
   ExerciseDefinition def;
   def.name = This::k_name;

   {
      MetricGroup g;
      g.key         = "front_knee_depth";
      g.metric      = "front_knee_flexion_p10";
      g.table       = make_lower_is_better(
          {{95.0, 95}, {110.0, 85}, {125.0, 70}}, 50);
      g.weight      = 0.30;
      g.praise      = "Good lunge depth on the front leg.";
      g.issue       = "Shallow front-knee depth";
      g.instruction = "Take a slightly longer stride, drop the back knee more "
                      "vertically, and keep the front heel rooted. Try "
                      "bodyweight tempo lunges (3-0-3).";
      g.breakdown   = [](real x) {
         return format("Deepest front-knee angle ≈ {:.0f}°. Aim ~90-110°.", x);
      };
      g.feedback = [](real x) {
         return format("Deepest front-knee angle ≈ {:.0f}°, suggesting "
                       "limited range.",
                       x);
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "knee_tracking";
      g.metric      = "knee_deviation_p90";
      g.table       = make_lower_is_better(
          {{0.15, 95}, {0.25, 80}, {0.35, 65}}, 50);
      g.weight      = 0.20;
      g.praise      = "Front knee tracks well over the toes.";
      g.issue       = "Front knee valgus/varus";
      g.instruction = "Press the front foot evenly (tripod) and guide the knee "
                      "over the 2nd-3rd toe. Slow tempo to build control.";
      g.breakdown   = [](real x) {
         return format("Peak lateral knee drift (normalized) ≈ {:.2f}. Track "
                       "knee over 2nd-3rd toe.",
                       x);
      };
      g.feedback = [](real) {
         return "The front knee drifts laterally relative to the foot line."s;
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "shin_angle";
      g.metric      = "shin_angle_median";
      g.table       = make_lower_is_better(
          {{15.0, 95}, {25.0, 80}, {35.0, 65}}, 50);
      g.weight      = 0.15;
      g.praise      = "Appropriate shin angle.";
      g.issue       = "Excessive shin angle";
      g.instruction = "Scoot the front foot forward a touch and descend more "
                      "vertically. Keep the knee stacked over the mid-foot.";
      g.breakdown   = [](real x) {
         return format("Median shin angle vs vertical ≈ {:.0f}°. Keep tibia "
                       "more upright if you feel knee stress.",
                       x);
      };
      g.feedback = [](real x) {
         return format("Shin angle vs vertical ≈ {:.0f}°.", x);
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "torso_alignment";
      g.metric      = "torso_lean_median";
      g.table       = make_lower_is_better(
          {{15.0, 95}, {25.0, 80}, {35.0, 65}}, 50);
      g.weight      = 0.15;
      g.praise      = "Upright torso and good bracing.";
      g.issue       = "Torso leaning forward";
      g.instruction = "Big breath into the belly and obliques before each rep; "
                      "keep ribs stacked over hips. Goblet reverse lunges "
                      "help groove posture.";
      g.breakdown   = [](real x) {
         return format("Median torso lean ≈ {:.0f}°. Brace and keep ribs "
                       "stacked over hips.",
                       x);
      };
      g.feedback = [](real x) {
         return format("Torso lean ≈ {:.0f}° may indicate poor bracing or "
                       "stride setup.",
                       x);
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key    = "step_width";
      g.metric = "step_width_ratio_median";
      g.table.rules
          = {ScoreRule::within(0.6, 1.2, 95), ScoreRule::within(0.4, 1.6, 80)};
      g.table.fallback = 60;
      g.weight         = 0.10;
      g.policy         = SeverityPolicy::ALWAYS_INFO;
      g.praise         = "Solid step width for balance.";
      g.issue          = "Tightrope stance";
      g.instruction    = "Set the feet hip-width apart like two rails, not a "
                         "single line. Maintain that width during the step.";
      g.breakdown      = [](real x) {
         return format("Step width ratio ≈ {:.2f} (feet width / pelvis "
                       "width). Avoid tightrope stance.",
                       x);
      };
      g.feedback = [](real x) {
         return format("Step width ratio ≈ {:.2f}, which may reduce balance.",
                       x);
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "stability";
      g.metric      = "knee_wobble";
      g.table       = make_lower_is_better(
          {{0.01, 95}, {0.02, 80}, {0.03, 65}}, 50);
      g.weight      = 0.10;
      g.praise      = "Stable knee path through reps.";
      g.issue       = "Knee wobble";
      g.instruction = "Slow the eccentric (2-3s), focus the knee toward the "
                      "2nd-3rd toe, and use light support (fingertips on a "
                      "rack) while learning.";
      g.breakdown   = [](real x) {
         return format("Knee path wobble (normalized) ≈ {:.3f}. Slow the "
                       "descent; focus on tripod foot.",
                       x);
      };
      g.feedback = [](real) {
         return "Notable side-to-side front-knee movement frame-to-frame."s;
      };
      def.groups.push_back(std::move(g));
   }

   def.correction_order = {"knee_tracking",
                           "front_knee_depth",
                           "shin_angle",
                           "torso_alignment",
                           "step_width",
                           "stability"};

   def.improvement_tips = {
       "Film at ~45° front angle with the entire body in frame.",
       "Brace before each rep: inhale, ribs down, descend vertically; exhale "
       "at the top.",
       "Keep the front heel heavy; think 'down not forward'.",
       "Use a slow 2-3s descent to control tracking and stability.",
       "Practice stationary split squats to build balance before dynamic "
       "lunges."};

   def.insufficient_message
       = "Not enough pose detections to analyze lunges. Try full-body "
         "framing, good lighting, and slower reps.";

   return def;
}

const ExerciseDefinition& This::definition() noexcept
{
   static const ExerciseDefinition def = make_lunge_definition();
   return def;
}

// ------------------------------------------------------------------ accumulate
//
bool This::accumulate(const PoseFrame& frame) noexcept
{
   auto at = [&](Side side, Joint j) {
      return frame.pixel(landmark_of(side, j));
   };

   const auto l_knee_angle = angle_at_vertex(at(Side::LEFT, Joint::HIP),
                                             at(Side::LEFT, Joint::KNEE),
                                             at(Side::LEFT, Joint::ANKLE));
   const auto r_knee_angle = angle_at_vertex(at(Side::RIGHT, Joint::HIP),
                                             at(Side::RIGHT, Joint::KNEE),
                                             at(Side::RIGHT, Joint::ANKLE));
   if(!l_knee_angle or !r_knee_angle) {
      TRACE(format("lunge frame {}, knee angle undefined", frame.frame_no()));
      return false;
   }

   const auto front
       = (*l_knee_angle < *r_knee_angle) ? Side::LEFT : Side::RIGHT;

   const auto f_shoulder = at(front, Joint::SHOULDER);
   const auto f_hip      = at(front, Joint::HIP);
   const auto f_knee     = at(front, Joint::KNEE);
   const auto f_ankle    = at(front, Joint::ANKLE);
   const auto f_toe      = at(front, Joint::TOE);
   const auto l_toe      = at(Side::LEFT, Joint::TOE);
   const auto r_toe      = at(Side::RIGHT, Joint::TOE);

   const auto pelvis_width
       = segment_length(at(Side::LEFT, Joint::HIP), at(Side::RIGHT, Joint::HIP));

   front_knee_flexion.push(front == Side::LEFT ? l_knee_angle : r_knee_angle);
   shin_angle.push(angle_to_vertical(f_ankle, f_knee));
   torso_lean.push(angle_to_vertical(f_hip, f_shoulder));
   knee_deviation.push(safe_ratio(dist_point_to_line(f_knee, f_ankle, f_toe),
                                  segment_length(f_hip, f_knee)));

   if(l_toe.has_value() and r_toe.has_value()) {
      step_width.push(safe_ratio(std::fabs(l_toe->x - r_toe->x), pelvis_width));
      stride_length.push(safe_ratio(std::fabs(l_toe->y - r_toe->y),
                                    segment_length(f_hip, f_ankle)));
   }

   knee_x.push(f_knee->x); // f_knee is defined: the knee angle was
   frame_width = frame.width();

   TRACE(format("lunge frame {}, front = {}, knee = {}",
                frame.frame_no(),
                str(front),
                front_knee_flexion.values.back()));

   return true;
}

// ------------------------------------------------------------------- stability
//
real This::stability() const noexcept
{
   if(knee_x.size() < k_min_stability_samples or frame_width <= 0) return 0.0;
   return knee_x.summary() / real(frame_width);
}

// ------------------------------------------------------------------- summarize
//
MetricSummaries This::summarize() const noexcept
{
   MetricSummaries ret;
   for(const auto* s : {&front_knee_flexion,
                        &knee_deviation,
                        &shin_angle,
                        &torso_lean,
                        &step_width,
                        &stride_length})
      ret.emplace_back(s->name, s->summary());
   ret.emplace_back("knee_wobble", stability());
   return ret;
}

AnalysisResult This::assess() const noexcept
{
   return assemble_result(definition(), summarize());
}

} // namespace formcheck

#undef This
