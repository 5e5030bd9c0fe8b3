#pragma once

#include "feedback.hpp"
#include "metric-series.hpp"

#include "formcheck/skeleton/landmark.hpp"

namespace formcheck
{
// ------------------------------------------------------------------ SquatModel
// Leg-side metrics, one frame at a time.
//
// The torso lean is measured from upright: 0 degrees when the shoulder is
// directly above the hip. Larger is worse.
struct SquatModel
{
   static constexpr const char* k_name = "squat";

   MetricSeries knee_flexion{"knee_flexion_p10", SummaryKind::P10};
   MetricSeries hip_flexion{"hip_flexion_p10", SummaryKind::P10};
   MetricSeries torso_lean{"torso_lean_median", SummaryKind::MEDIAN};
   MetricSeries dorsiflexion{"ankle_dorsiflexion_p90", SummaryKind::P90};
   MetricSeries knee_deviation{"knee_deviation_p90", SummaryKind::P90};
   MetricSeries hip_below_knee{"hip_below_knee_p90", SummaryKind::P90};

   static const ExerciseDefinition& definition() noexcept;

   // Returns TRUE iff the frame yielded the primary metric (knee flexion)
   bool accumulate(const PoseFrame& frame) noexcept;

   size_t n_primary() const noexcept { return knee_flexion.size(); }

   MetricSummaries summarize() const noexcept;

   AnalysisResult assess() const noexcept;
};

} // namespace formcheck
