#include "pushup.hpp"

#include "formcheck/geometry/angles.hpp"
#include "formcheck/skeleton/side-selector.hpp"

#define This PushupModel

namespace formcheck
{
// ------------------------------------------------------------------ definition
//
static ExerciseDefinition make_pushup_definition() noexcept
{
   ExerciseDefinition def;
   def.name = This::k_name;

   {
      MetricGroup g;
      g.key         = "elbow_depth";
      g.metric      = "elbow_flexion_p10";
      g.table       = make_lower_is_better(
          {{70.0, 95}, {90.0, 85}, {110.0, 70}}, 55);
      g.weight      = 0.35;
      g.praise      = "Solid push-up depth.";
      g.issue       = "Shallow depth";
      g.instruction = "Use incline push-ups to keep full range of motion "
                      "without losing body line. Slow 2-3s descent.";
      g.breakdown   = [](real x) {
         return format("Bottom elbow angle ≈ {:.0f}°.", x);
      };
      g.feedback = [](real x) {
         return format("Bottom elbow angle ~{:.0f}° indicates limited depth.",
                       x);
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "body_line";
      g.metric      = "body_line_deviation_median";
      g.table       = make_lower_is_better(
          {{0.04, 95}, {0.07, 82}, {0.12, 68}}, 50);
      g.weight      = 0.35;
      g.praise      = "Strong plank line.";
      g.issue       = "Hip sag/pike";
      g.instruction = "Squeeze glutes and quads and keep ribs down; reduce "
                      "reps if the line breaks.";
      g.breakdown   = [](real x) {
         return format("Hip deviation (norm) ≈ {:.2f}.", x);
      };
      g.feedback = [](real) {
         return "Hips not aligned with shoulders and ankles."s;
      };
      def.groups.push_back(std::move(g));
   }

   {
      MetricGroup g;
      g.key         = "neck_alignment";
      g.metric      = "neck_tilt_median";
      g.table       = make_lower_is_better(
          {{10.0, 95}, {20.0, 82}, {30.0, 68}}, 55);
      g.weight      = 0.15;
      g.policy      = SeverityPolicy::ALWAYS_INFO;
      g.praise      = "Neutral head/neck.";
      g.issue       = "Neck not neutral";
      g.instruction = "Gaze 30-50 cm ahead; keep the back of your head long.";
      g.breakdown   = [](real x) { return format("Neck tilt ≈ {:.0f}°.", x); };
      g.feedback    = [](real) {
         return "Head position suggests craning or dropping."s;
      };
      def.groups.push_back(std::move(g));
   }

   {
      // Corrected below 90, so that any offset past half an upper arm is
      // reported. An 82 is praised and corrected.
      MetricGroup g;
      g.key           = "hand_placement";
      g.metric        = "hand_offset_median";
      g.table         = make_lower_is_better(
          {{0.5, 95}, {0.8, 82}, {1.1, 68}}, 55);
      g.weight        = 0.15;
      g.correct_below = 90;
      g.praise        = "Good hand stacking.";
      g.issue         = "Hands not under shoulders";
      g.instruction   = "Stack wrists under shoulders; screw hands into the "
                        "floor.";
      g.breakdown     = [](real x) {
         return format("Hand offset ≈ {:.2f}× upper-arm length.", x);
      };
      g.feedback = [](real) {
         return "Hands appear too far forward or back of the shoulders."s;
      };
      def.groups.push_back(std::move(g));
   }

   def.correction_order
       = {"elbow_depth", "body_line", "neck_alignment", "hand_placement"};

   def.improvement_tips = {"Film from the side; include wrists to ankles.",
                           "Brace like a plank (glutes + quads on).",
                           "Use tempo (3s down, 1s up) for control."};

   def.insufficient_message = "Not enough pose detections for push-up. Use a "
                              "side view and good lighting.";

   return def;
}

const ExerciseDefinition& This::definition() noexcept
{
   static const ExerciseDefinition def = make_pushup_definition();
   return def;
}

// ------------------------------------------------------------------ accumulate
//
bool This::accumulate(const PoseFrame& frame) noexcept
{
   const auto side = choose_arm_side(frame);
   auto at = [&](Joint j) { return frame.pixel(landmark_of(side, j)); };

   const auto shoulder = at(Joint::SHOULDER);
   const auto elbow    = at(Joint::ELBOW);
   const auto wrist    = at(Joint::WRIST);
   const auto hip      = at(Joint::HIP);
   const auto ankle    = at(Joint::ANKLE);
   const auto ear      = at(Joint::EAR);

   const bool has_primary
       = elbow_flexion.push(angle_at_vertex(shoulder, elbow, wrist));

   body_line.push(safe_ratio(dist_point_to_line(hip, shoulder, ankle),
                             segment_length(shoulder, ankle)));

   if(const auto theta = angle_to_horizontal(ear, shoulder); theta.has_value())
      neck_tilt.push(std::min(*theta, 180.0 - *theta));

   if(wrist.has_value() and shoulder.has_value())
      hand_offset.push(safe_ratio(std::fabs(wrist->x - shoulder->x),
                                  segment_length(shoulder, elbow)));

   TRACE(format("push-up frame {}, side = {}, elbow = {}",
                frame.frame_no(),
                str(side),
                has_primary ? str(elbow_flexion.values.back()) : "-"s));

   return has_primary;
}

// ------------------------------------------------------------------- summarize
//
MetricSummaries This::summarize() const noexcept
{
   MetricSummaries ret;
   for(const auto* s : {&elbow_flexion, &body_line, &neck_tilt, &hand_offset})
      ret.emplace_back(s->name, s->summary());
   return ret;
}

AnalysisResult This::assess() const noexcept
{
   return assemble_result(definition(), summarize());
}

} // namespace formcheck

#undef This
