#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/assessment/exercise.hpp"

#include "testcases/synthetic-poses.hpp"

static const bool feedback = false;

namespace formcheck
{
using namespace formcheck::testing;

// ------------------------------------------------------------------ SquatModel
//
CATCH_TEST_CASE("SquatModel", "[squat-model]")
{
   CATCH_SECTION("single-frame")
   {
      SquatModel model;
      CATCH_REQUIRE(model.accumulate(make_squat_frame(1, 100.0)));
      CATCH_REQUIRE(model.n_primary() == 1);
      CATCH_REQUIRE(model.knee_flexion.values[0] == Approx(100.0));
      CATCH_REQUIRE(model.hip_flexion.values[0] == Approx(100.0));
      CATCH_REQUIRE(model.torso_lean.values[0] == Approx(0.0).margin(1e-9));
      CATCH_REQUIRE(model.dorsiflexion.values[0] == Approx(90.0));
      CATCH_REQUIRE(model.knee_deviation.values[0] == Approx(1.0));
      CATCH_REQUIRE(model.hip_below_knee.values[0]
                    == Approx(200.0 * std::cos(to_radians(100.0))));
   }

   CATCH_SECTION("full-rep")
   {
      SquatModel model;
      int frame_no = 0;
      for(const auto alpha : squat_rep_angles())
         CATCH_REQUIRE(model.accumulate(make_squat_frame(++frame_no, alpha)));

      const auto m = model.summarize();
      CATCH_REQUIRE(m.size() == 6);
      CATCH_REQUIRE(m[0].first == "knee_flexion_p10");
      CATCH_REQUIRE(find_metric(m, "knee_flexion_p10").value()
                    == Approx(90.0));

      const auto r = model.assess();
      CATCH_REQUIRE(r.exercise == "squat");
      CATCH_REQUIRE(r.overall_score == 84);
      CATCH_REQUIRE(r.find_subscore("depth")->score == 95);
      CATCH_REQUIRE(r.find_subscore("torso_alignment")->score == 95);
      CATCH_REQUIRE(r.find_subscore("knee_tracking")->score == 50);
      CATCH_REQUIRE(r.find_subscore("ankle_mobility")->score == 95);
      CATCH_REQUIRE(r.corrections.size() == 1);
      CATCH_REQUIRE(r.corrections[0].issue == "Knee valgus");
      CATCH_REQUIRE(r.corrections[0].severity == Severity::CRITICAL);
      CATCH_REQUIRE(r.whats_right.size() == 3);
      if(feedback) cout << str(r) << endl;
   }

   CATCH_SECTION("missing-landmarks")
   {
      SquatModel model;
      PoseFrame f{1, k_size, k_size};
      f.set(L_HIP, make_landmark(0.5, 0.3));
      f.set(L_SHOULDER, make_landmark(0.5, 0.1));
      CATCH_REQUIRE(!model.accumulate(f));
      CATCH_REQUIRE(model.n_primary() == 0);
      CATCH_REQUIRE(model.torso_lean.size() == 1);
      CATCH_REQUIRE(model.hip_flexion.empty());
   }

   CATCH_SECTION("uses-the-more-visible-side")
   {
      // A right leg that is bent to 60 degrees, but less visible
      auto f = make_squat_frame(1, 120.0);
      f.set(R_HIP, make_landmark(0.3, 0.5, 0.4));
      f.set(R_KNEE, make_landmark(0.2, 0.5, 0.4));
      f.set(R_ANKLE, make_landmark(0.3, 0.5 + 0.1 * std::sqrt(3.0), 0.4));
      SquatModel model;
      CATCH_REQUIRE(model.accumulate(f));
      CATCH_REQUIRE(model.knee_flexion.values[0] == Approx(120.0));
   }
}

// ----------------------------------------------------------------- PushupModel
//
CATCH_TEST_CASE("PushupModel", "[pushup-model]")
{
   CATCH_SECTION("single-frame")
   {
      PushupModel model;
      CATCH_REQUIRE(model.accumulate(make_pushup_frame(1, 80.0)));
      CATCH_REQUIRE(model.elbow_flexion.values[0] == Approx(80.0));
      CATCH_REQUIRE(model.body_line.values[0] == Approx(0.0).margin(1e-9));
      CATCH_REQUIRE(model.neck_tilt.values[0] == Approx(0.0).margin(1e-9));
      CATCH_REQUIRE(model.hand_offset.values[0] == Approx(0.6));
   }

   CATCH_SECTION("full-rep")
   {
      vector<real> alphas;
      for(int i = 0; i < 10; ++i) alphas.push_back(160.0 - 80.0 * i / 10.0);
      for(int i = 0; i < 4; ++i) alphas.push_back(80.0);
      for(int i = 1; i <= 10; ++i) alphas.push_back(80.0 + 80.0 * i / 10.0);

      PushupModel model;
      int frame_no = 0;
      for(const auto alpha : alphas)
         CATCH_REQUIRE(model.accumulate(make_pushup_frame(++frame_no, alpha)));
      CATCH_REQUIRE(model.n_primary() == 24);

      const auto r = model.assess();
      CATCH_REQUIRE(r.exercise == "pushup");
      CATCH_REQUIRE(r.find_subscore("elbow_depth")->score == 85);
      CATCH_REQUIRE(r.find_subscore("body_line")->score == 95);
      CATCH_REQUIRE(r.find_subscore("neck_alignment")->score == 95);
      CATCH_REQUIRE(r.find_subscore("hand_placement")->score == 82);
      CATCH_REQUIRE(r.overall_score == 90);
      CATCH_REQUIRE(r.corrections.size() == 1);
      CATCH_REQUIRE(r.corrections[0].issue == "Hands not under shoulders");
      CATCH_REQUIRE(r.corrections[0].severity == Severity::WARNING);

      // Every group at 80 or above is praised, hand placement included
      CATCH_REQUIRE(r.whats_right.size() == 4);
      CATCH_REQUIRE(ranges::find(r.whats_right, "Good hand stacking."s)
                    != r.whats_right.end());
   }
}

// ------------------------------------------------------------------ LungeModel
//
// Left leg: knee at 90 degrees, shin vertical, shoulder above hip.
static PoseFrame make_lunge_frame(int frame_no, bool right_bent)
{
   PoseFrame f{frame_no, k_size, k_size};
   f.set(L_SHOULDER, make_landmark(0.375, 0.25));
   f.set(L_HIP, make_landmark(0.375, 0.5));
   f.set(L_KNEE, make_landmark(0.5, 0.5));
   f.set(L_ANKLE, make_landmark(0.5, 0.75));
   f.set(L_TOE, make_landmark(0.5625, 0.75));

   f.set(R_SHOULDER, make_landmark(0.625, 0.25));
   f.set(R_HIP, make_landmark(0.625, 0.5));
   f.set(R_KNEE, make_landmark(0.75, 0.5));
   f.set(R_TOE, make_landmark(0.8125, 0.75));
   if(right_bent) { // the same 90 degree knee as the left leg
      f.set(R_ANKLE, make_landmark(0.75, 0.75));
   } else { // 150 degrees
      const real theta = to_radians(30.0);
      f.set(R_ANKLE,
            make_landmark(0.75 + 0.25 * std::cos(theta),
                          0.5 + 0.25 * std::sin(theta)));
   }
   return f;
}

CATCH_TEST_CASE("LungeModel", "[lunge-model]")
{
   CATCH_SECTION("front-leg-is-the-more-flexed")
   {
      LungeModel model;
      CATCH_REQUIRE(model.accumulate(make_lunge_frame(1, false)));
      CATCH_REQUIRE(model.front_knee_flexion.values[0] == Approx(90.0));
      CATCH_REQUIRE(model.knee_x.values[0] == Approx(500.0)); // left knee
      CATCH_REQUIRE(model.shin_angle.values[0] == Approx(0.0).margin(1e-9));
      CATCH_REQUIRE(model.torso_lean.values[0] == Approx(0.0).margin(1e-9));
      CATCH_REQUIRE(model.knee_deviation.values[0] == Approx(2.0));
      CATCH_REQUIRE(model.step_width.values[0] == Approx(1.0));
      CATCH_REQUIRE(model.stride_length.values[0]
                    == Approx(0.0).margin(1e-9));
      CATCH_REQUIRE(model.frame_width == k_size);
   }

   CATCH_SECTION("tie-goes-right")
   {
      LungeModel model;
      CATCH_REQUIRE(model.accumulate(make_lunge_frame(1, true)));
      CATCH_REQUIRE(model.knee_x.values[0] == Approx(750.0)); // right knee
   }

   CATCH_SECTION("both-knees-required")
   {
      auto f = make_lunge_frame(1, false);
      f.set(R_ANKLE, Landmark{});
      LungeModel model;
      CATCH_REQUIRE(!model.accumulate(f));
      CATCH_REQUIRE(model.n_primary() == 0);
      CATCH_REQUIRE(model.knee_x.empty());
      CATCH_REQUIRE(model.step_width.empty());
   }

   CATCH_SECTION("stability")
   {
      LungeModel model;
      model.frame_width = 1000;
      model.knee_x.values = {2.0, 4.0, 4.0, 4.0};
      CATCH_REQUIRE(model.stability() == 0.0); // too few samples
      model.knee_x.values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
      CATCH_REQUIRE(model.stability() == Approx(0.002));
      CATCH_REQUIRE(find_metric(model.summarize(), "knee_wobble").value()
                    == Approx(0.002));
   }

   CATCH_SECTION("steady-lunges")
   {
      LungeModel model;
      for(int i = 1; i <= 10; ++i)
         CATCH_REQUIRE(model.accumulate(make_lunge_frame(i, false)));
      const auto r = model.assess();
      CATCH_REQUIRE(r.exercise == "lunge");
      CATCH_REQUIRE(r.find_subscore("front_knee_depth")->score == 95);
      CATCH_REQUIRE(r.find_subscore("knee_tracking")->score == 50);
      CATCH_REQUIRE(r.find_subscore("shin_angle")->score == 95);
      CATCH_REQUIRE(r.find_subscore("torso_alignment")->score == 95);
      CATCH_REQUIRE(r.find_subscore("step_width")->score == 95);
      CATCH_REQUIRE(r.find_subscore("stability")->score == 95);
      // 0.3*95 + 0.2*50 + 0.15*95 + 0.15*95 + 0.1*95 + 0.1*95
      CATCH_REQUIRE(r.overall_score == 86);
      CATCH_REQUIRE(r.corrections.size() == 1);
      CATCH_REQUIRE(r.corrections[0].issue == "Front knee valgus/varus");
      CATCH_REQUIRE(r.corrections[0].severity == Severity::CRITICAL);
   }
}

} // namespace formcheck
