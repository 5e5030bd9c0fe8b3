#pragma once

#include "feedback.hpp"
#include "metric-series.hpp"

#include "formcheck/skeleton/landmark.hpp"

namespace formcheck
{
// ------------------------------------------------------------------ LungeModel
// Both legs are measured on every frame. The front leg is the one with the
// smaller (more flexed) knee angle; a tie goes to the right leg. Frames where
// either knee angle is undefined contribute nothing.
//
// Shin and torso angles are measured from vertical: 0 degrees is a vertical
// shin (knee above ankle) and an upright torso (shoulder above hip).
struct LungeModel
{
   static constexpr const char* k_name = "lunge";

   // Fewer knee-x samples than this give a stability of 0.0
   static constexpr size_t k_min_stability_samples = 5;

   MetricSeries front_knee_flexion{"front_knee_flexion_p10", SummaryKind::P10};
   MetricSeries knee_deviation{"knee_deviation_p90", SummaryKind::P90};
   MetricSeries shin_angle{"shin_angle_median", SummaryKind::MEDIAN};
   MetricSeries torso_lean{"torso_lean_median", SummaryKind::MEDIAN};
   MetricSeries step_width{"step_width_ratio_median", SummaryKind::MEDIAN};
   MetricSeries stride_length{"stride_length_ratio_median",
                              SummaryKind::MEDIAN};
   MetricSeries knee_x{"front_knee_x", SummaryKind::STDDEV}; // pixels

   int frame_width = 0; // of the most recent frame

   static const ExerciseDefinition& definition() noexcept;

   // Returns TRUE iff the frame yielded the primary metric (front knee flexion)
   bool accumulate(const PoseFrame& frame) noexcept;

   size_t n_primary() const noexcept { return front_knee_flexion.size(); }

   // Standard deviation of the front knee x position, over the frame width
   real stability() const noexcept;

   MetricSummaries summarize() const noexcept;

   AnalysisResult assess() const noexcept;
};

} // namespace formcheck
