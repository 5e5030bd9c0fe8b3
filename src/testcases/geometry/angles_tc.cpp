#include <random>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/geometry/angles.hpp"
#include "formcheck/utils/math.hpp"

static const bool feedback = false;

namespace formcheck
{
CATCH_TEST_CASE("AngleAtVertex", "[angle-at-vertex]")
{
   CATCH_SECTION("right-angle-and-straight")
   {
      const Vector2 b{10.0, 10.0};
      CATCH_REQUIRE(angle_at_vertex(Vector2{20.0, 10.0}, b, Vector2{10.0, 0.0})
                        .value()
                    == Approx(90.0));
      CATCH_REQUIRE(angle_at_vertex(Vector2{20.0, 10.0}, b, Vector2{0.0, 10.0})
                        .value()
                    == Approx(180.0));
      CATCH_REQUIRE(angle_at_vertex(Vector2{20.0, 10.0}, b, Vector2{30.0, 10.0})
                        .value()
                    == Approx(0.0).margin(1e-6));
      CATCH_REQUIRE(angle_at_vertex(Vector2{1.0, 1.0}, Vector2{0.0, 0.0},
                                    Vector2{1.0, 0.0})
                        .value()
                    == Approx(45.0));
   }

   CATCH_SECTION("always-in-range")
   {
      std::mt19937 gen(11);
      std::uniform_real_distribution<real> distrib(-500.0, 500.0);
      auto rand_v = [&]() { return Vector2{distrib(gen), distrib(gen)}; };
      for(auto i = 0; i < 1000; ++i) {
         const auto a = rand_v(), b = rand_v(), c = rand_v();
         const auto theta = angle_at_vertex(a, b, c);
         CATCH_REQUIRE(theta.has_value());
         CATCH_REQUIRE(*theta >= 0.0);
         CATCH_REQUIRE(*theta <= 180.0);
         if(feedback) cout << format("theta = {}", *theta) << endl;
      }
   }

   CATCH_SECTION("nearly-collinear-is-clamped")
   {
      // Floating point overshoot in the cosine must not produce a NAN
      const Vector2 a{1e8, 1e8 + 1.0};
      const Vector2 b{0.0, 0.0};
      const Vector2 c{3e8, 3e8 + 3.0};
      const auto theta = angle_at_vertex(a, b, c);
      CATCH_REQUIRE(theta.has_value());
      CATCH_REQUIRE(std::isfinite(*theta));
   }

   CATCH_SECTION("degenerate")
   {
      const Vector2 a{3.0, 4.0};
      CATCH_REQUIRE(!angle_at_vertex(a, a, Vector2{1.0, 1.0}).has_value());
      CATCH_REQUIRE(!angle_at_vertex(Vector2{1.0, 1.0}, a, a).has_value());
      CATCH_REQUIRE(!angle_at_vertex(a, a, a).has_value());
      CATCH_REQUIRE(
          !angle_at_vertex(Vector2::nan(), a, Vector2{1.0, 1.0}).has_value());
   }

   CATCH_SECTION("optional-points")
   {
      const OptVector2 a = Vector2{1.0, 0.0};
      const OptVector2 b = Vector2{0.0, 0.0};
      const OptVector2 c = std::nullopt;
      CATCH_REQUIRE(!angle_at_vertex(a, b, c).has_value());
      CATCH_REQUIRE(angle_at_vertex(a, b, OptVector2{Vector2{0.0, 1.0}})
                        .value()
                    == Approx(90.0));
   }
}

CATCH_TEST_CASE("AngleToVertical", "[angle-to-vertical]")
{
   CATCH_SECTION("image-conventions")
   {
      const Vector2 b{100.0, 100.0};
      // `a` directly below `b` (y grows downward)
      CATCH_REQUIRE(angle_to_vertical(Vector2{100.0, 150.0}, b).value()
                    == Approx(0.0).margin(1e-9));
      // `a` directly above `b`
      CATCH_REQUIRE(angle_to_vertical(Vector2{100.0, 50.0}, b).value()
                    == Approx(180.0));
      CATCH_REQUIRE(angle_to_vertical(Vector2{150.0, 100.0}, b).value()
                    == Approx(90.0));
      CATCH_REQUIRE(angle_to_vertical(Vector2{110.0, 110.0}, b).value()
                    == Approx(45.0));
      CATCH_REQUIRE(!angle_to_vertical(b, b).has_value());
   }

   CATCH_SECTION("horizontal")
   {
      const Vector2 b{0.0, 0.0};
      CATCH_REQUIRE(angle_to_horizontal(Vector2{5.0, 0.0}, b).value()
                    == Approx(0.0).margin(1e-9));
      CATCH_REQUIRE(angle_to_horizontal(Vector2{-5.0, 0.0}, b).value()
                    == Approx(180.0));
      CATCH_REQUIRE(angle_to_horizontal(Vector2{0.0, -5.0}, b).value()
                    == Approx(90.0));
      CATCH_REQUIRE(!angle_to_horizontal(b, b).has_value());
   }
}

CATCH_TEST_CASE("DistPointToLine", "[dist-point-to-line]")
{
   CATCH_SECTION("distances")
   {
      const Vector2 a{0.0, 0.0};
      const Vector2 b{10.0, 0.0};
      CATCH_REQUIRE(dist_point_to_line(Vector2{5.0, 3.0}, a, b).value()
                    == Approx(3.0));
      // The line is infinite
      CATCH_REQUIRE(dist_point_to_line(Vector2{-50.0, -4.0}, a, b).value()
                    == Approx(4.0));
      CATCH_REQUIRE(
          dist_point_to_line(Vector2{0.0, 1.0}, a, Vector2{1.0, 1.0}).value()
          == Approx(std::sqrt(0.5)));
   }

   CATCH_SECTION("collinear-is-zero")
   {
      const Vector2 a{1.0, 2.0};
      const Vector2 b{4.0, 8.0};
      for(auto t : {-3.0, 0.0, 0.25, 1.0, 7.5}) {
         const Vector2 p = a + (b - a) * t;
         CATCH_REQUIRE(dist_point_to_line(p, a, b).value()
                       == Approx(0.0).margin(1e-9));
      }
   }

   CATCH_SECTION("degenerate")
   {
      const Vector2 a{1.0, 2.0};
      CATCH_REQUIRE(!dist_point_to_line(Vector2{0.0, 0.0}, a, a).has_value());
   }
}

CATCH_TEST_CASE("SafeRatio", "[safe-ratio]")
{
   CATCH_SECTION("safe-ratio")
   {
      CATCH_REQUIRE(safe_ratio(std::optional<real>{6.0}, 3.0).value()
                    == Approx(2.0));
      CATCH_REQUIRE(!safe_ratio(std::optional<real>{6.0}, 0.0).has_value());
      CATCH_REQUIRE(!safe_ratio(std::nullopt, 2.0).has_value());
      CATCH_REQUIRE(!safe_ratio(std::optional<real>{6.0},
                                std::optional<real>{})
                         .has_value());
      CATCH_REQUIRE(
          !safe_ratio(std::optional<real>{6.0}, dNAN).has_value());
      CATCH_REQUIRE(segment_length(Vector2{0.0, 0.0}, Vector2{3.0, 4.0}).value()
                    == Approx(5.0));
   }
}

} // namespace formcheck
