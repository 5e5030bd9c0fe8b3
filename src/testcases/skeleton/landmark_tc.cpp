
#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/io/json-io.hpp"
#include "formcheck/skeleton/landmark.hpp"
#include "formcheck/skeleton/side-selector.hpp"

static const bool feedback = false;

namespace formcheck
{
static Landmark lm(real x, real y, real vis)
{
   Landmark o;
   o.xy         = Vector2{x, y};
   o.visibility = vis;
   return o;
}

CATCH_TEST_CASE("LandmarkNames", "[landmark-names]")
{
   CATCH_SECTION("round-trip")
   {
      for(int i = 0; i < k_n_landmarks; ++i) {
         const auto name = int_to_landmark_name(i);
         CATCH_REQUIRE(int(name) == i);
         CATCH_REQUIRE(to_landmark_name(str(name)) == name);
      }
   }

   CATCH_SECTION("case-insensitive")
   {
      CATCH_REQUIRE(to_landmark_name("l_hip") == L_HIP);
      CATCH_REQUIRE(to_landmark_name(" R_Toe ") == R_TOE);
      CATCH_REQUIRE_THROWS(to_landmark_name("NOSE"));
      CATCH_REQUIRE_THROWS(int_to_landmark_name(k_n_landmarks));
   }
}

CATCH_TEST_CASE("PoseFrame", "[pose-frame]")
{
   CATCH_SECTION("pixels-and-visibility")
   {
      PoseFrame f{7, 640, 480};
      f.set(L_HIP, lm(0.5, 0.25, 0.8));
      f.set(R_HIP, lm(0.25, 0.5, 0.4));

      CATCH_REQUIRE(f.frame_no() == 7);
      CATCH_REQUIRE(f.n_landmarks() == 2);
      CATCH_REQUIRE(f.has(L_HIP));
      CATCH_REQUIRE(!f.has(L_KNEE));

      const auto p = f.pixel(L_HIP);
      CATCH_REQUIRE(p.has_value());
      CATCH_REQUIRE(p->x == Approx(320.0));
      CATCH_REQUIRE(p->y == Approx(120.0));
      CATCH_REQUIRE(!f.pixel(L_KNEE).has_value());

      CATCH_REQUIRE(f.visibility(L_HIP) == Approx(0.8));
      CATCH_REQUIRE(f.visibility(L_KNEE) == 0.0);
      CATCH_REQUIRE(f.overall_visibility() == Approx(0.6));
      CATCH_REQUIRE(PoseFrame{}.overall_visibility() == 0.0);

      const auto g = f.resized(9, 100, 100);
      CATCH_REQUIRE(g.frame_no() == 9);
      CATCH_REQUIRE(g.pixel(L_HIP)->x == Approx(50.0));
   }

   CATCH_SECTION("json")
   {
      const auto o = parse_json(R"V0G0N(
{"l_knee": [0.5, 0.6, 0.9], "R_KNEE": [0.25, 0.75]}
)V0G0N");
      const auto f = landmarks_from_json(o, 3, 100, 200);
      CATCH_REQUIRE(f.n_landmarks() == 2);
      CATCH_REQUIRE(f.visibility(L_KNEE) == Approx(0.9));
      CATCH_REQUIRE(f.visibility(R_KNEE) == Approx(1.0));
      CATCH_REQUIRE(f.pixel(R_KNEE)->y == Approx(150.0));

      const auto g = landmarks_from_json(f.landmarks_to_json(), 3, 100, 200);
      CATCH_REQUIRE(g.pixel(L_KNEE)->x == Approx(50.0));

      CATCH_REQUIRE_THROWS(
          landmarks_from_json(parse_json(R"({"L_KNEE": [0.5]})"), 1, 1, 1));
      CATCH_REQUIRE_THROWS(
          landmarks_from_json(parse_json(R"({"NOSE": [0.5, 0.5]})"), 1, 1, 1));
      CATCH_REQUIRE_THROWS(landmarks_from_json(parse_json("[1, 2]"), 1, 1, 1));
   }
}

CATCH_TEST_CASE("SideSelector", "[side-selector]")
{
   CATCH_SECTION("landmark-of")
   {
      CATCH_REQUIRE(landmark_of(Side::LEFT, Joint::KNEE) == L_KNEE);
      CATCH_REQUIRE(landmark_of(Side::RIGHT, Joint::TOE) == R_TOE);
      CATCH_REQUIRE(landmark_of(Side::RIGHT, Joint::EAR) == R_EAR);
      CATCH_REQUIRE(opposite(Side::LEFT) == Side::RIGHT);
      CATCH_REQUIRE(to_side(str(Side::RIGHT)) == Side::RIGHT);
   }

   CATCH_SECTION("leg-side")
   {
      PoseFrame f{1, 100, 100};
      f.set(L_HIP, lm(0.5, 0.5, 0.5));
      f.set(L_KNEE, lm(0.5, 0.6, 0.5));
      f.set(R_HIP, lm(0.5, 0.5, 0.6));
      f.set(R_KNEE, lm(0.5, 0.6, 0.6));
      CATCH_REQUIRE(choose_leg_side(f) == Side::RIGHT);

      // Other landmarks do not count towards the leg group
      f.set(L_SHOULDER, lm(0.5, 0.2, 1.0));
      f.set(L_ANKLE, lm(0.5, 0.8, 1.0));
      CATCH_REQUIRE(choose_leg_side(f) == Side::RIGHT);

      // Ties go left
      f.set(R_HIP, lm(0.5, 0.5, 0.75));
      f.set(R_KNEE, lm(0.5, 0.6, 0.25));
      CATCH_REQUIRE(choose_leg_side(f) == Side::LEFT);

      // Deterministic
      for(int i = 0; i < 10; ++i)
         CATCH_REQUIRE(choose_leg_side(f) == Side::LEFT);

      // An empty frame is a tie
      CATCH_REQUIRE(choose_leg_side(PoseFrame{}) == Side::LEFT);
   }

   CATCH_SECTION("arm-side")
   {
      PoseFrame f{1, 100, 100};
      f.set(L_SHOULDER, lm(0.5, 0.5, 0.30));
      f.set(L_ELBOW, lm(0.5, 0.5, 0.30));
      f.set(L_WRIST, lm(0.5, 0.5, 0.30));
      f.set(R_SHOULDER, lm(0.5, 0.5, 0.31));
      f.set(R_ELBOW, lm(0.5, 0.5, 0.30));
      f.set(R_WRIST, lm(0.5, 0.5, 0.30));
      CATCH_REQUIRE(choose_arm_side(f) == Side::RIGHT);

      // A strict majority wins, however small the visibilities
      f.set(L_WRIST, lm(0.5, 0.5, 0.32));
      CATCH_REQUIRE(choose_arm_side(f) == Side::LEFT);

      // Hips are not in the arm group
      f.set(R_HIP, lm(0.5, 0.5, 1.0));
      CATCH_REQUIRE(choose_arm_side(f) == Side::LEFT);
   }
}

} // namespace formcheck
