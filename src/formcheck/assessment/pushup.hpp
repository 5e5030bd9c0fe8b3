#pragma once

#include "feedback.hpp"
#include "metric-series.hpp"

#include "formcheck/skeleton/landmark.hpp"

namespace formcheck
{
// ----------------------------------------------------------------- PushupModel
// Arm-side metrics. The neck tilt is the ear-shoulder line against the
// horizontal, folded into [0..90] so that facing left or right reads the
// same.
struct PushupModel
{
   static constexpr const char* k_name = "pushup";

   MetricSeries elbow_flexion{"elbow_flexion_p10", SummaryKind::P10};
   MetricSeries body_line{"body_line_deviation_median", SummaryKind::MEDIAN};
   MetricSeries neck_tilt{"neck_tilt_median", SummaryKind::MEDIAN};
   MetricSeries hand_offset{"hand_offset_median", SummaryKind::MEDIAN};

   static const ExerciseDefinition& definition() noexcept;

   // Returns TRUE iff the frame yielded the primary metric (elbow flexion)
   bool accumulate(const PoseFrame& frame) noexcept;

   size_t n_primary() const noexcept { return elbow_flexion.size(); }

   MetricSummaries summarize() const noexcept;

   AnalysisResult assess() const noexcept;
};

} // namespace formcheck
