#include <random>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/assessment/score-table.hpp"
#include "formcheck/utils/math.hpp"

static const bool feedback = false;

namespace formcheck
{
CATCH_TEST_CASE("ScoreTable", "[score-table]")
{
   CATCH_SECTION("lower-is-better")
   {
      const auto t = make_lower_is_better(
          {{95.0, 95}, {110.0, 85}, {125.0, 70}}, 50);
      CATCH_REQUIRE(t.evaluate(60.0) == 95);
      CATCH_REQUIRE(t.evaluate(95.0) == 95); // boundaries are inclusive
      CATCH_REQUIRE(t.evaluate(95.01) == 85);
      CATCH_REQUIRE(t.evaluate(110.0) == 85);
      CATCH_REQUIRE(t.evaluate(125.0) == 70);
      CATCH_REQUIRE(t.evaluate(125.5) == 50);
      CATCH_REQUIRE(t.evaluate(dNAN) == 50);
      CATCH_REQUIRE(t.min_subscore() == 50);
      CATCH_REQUIRE(t.max_subscore() == 95);
      if(feedback) cout << str(t) << endl;
   }

   CATCH_SECTION("higher-is-better")
   {
      const auto t
          = make_higher_is_better({{30.0, 95}, {20.0, 80}, {15.0, 65}}, 50);
      CATCH_REQUIRE(t.evaluate(45.0) == 95);
      CATCH_REQUIRE(t.evaluate(30.0) == 95);
      CATCH_REQUIRE(t.evaluate(25.0) == 80);
      CATCH_REQUIRE(t.evaluate(15.0) == 65);
      CATCH_REQUIRE(t.evaluate(14.9) == 50);
   }

   CATCH_SECTION("within-band")
   {
      ScoreTable t;
      t.rules    = {ScoreRule::within(0.6, 1.2, 95),
                 ScoreRule::within(0.4, 1.6, 80)};
      t.fallback = 60;
      CATCH_REQUIRE(t.evaluate(0.9) == 95);
      CATCH_REQUIRE(t.evaluate(0.6) == 95);
      CATCH_REQUIRE(t.evaluate(0.5) == 80);
      CATCH_REQUIRE(t.evaluate(1.5) == 80);
      CATCH_REQUIRE(t.evaluate(0.2) == 60);
      CATCH_REQUIRE(t.evaluate(2.0) == 60);
   }

   CATCH_SECTION("first-match-wins")
   {
      ScoreTable t;
      t.rules    = {ScoreRule::at_most(10.0, 70), ScoreRule::at_most(5.0, 95)};
      t.fallback = 50;
      CATCH_REQUIRE(t.evaluate(1.0) == 70);
   }
}

CATCH_TEST_CASE("WeightedOverall", "[weighted-overall]")
{
   CATCH_SECTION("squat-weights")
   {
      CATCH_REQUIRE(weighted_overall({{95, 0.35}, {95, 0.30}, {50, 0.25},
                                      {95, 0.10}})
                    == 84);
      CATCH_REQUIRE(weighted_overall({{50, 0.35}, {50, 0.30}, {50, 0.25},
                                      {50, 0.10}})
                    == 50);
   }

   CATCH_SECTION("within-convex-hull")
   {
      std::mt19937 gen(7);
      std::uniform_int_distribution<int> score_distrib(50, 95);
      std::uniform_real_distribution<real> weight_distrib(0.01, 1.0);

      for(auto i = 0; i < 500; ++i) {
         const auto n = size_t(1 + i % 6);
         vector<real> w(n);
         for(auto& x : w) x = weight_distrib(gen);
         const auto sum_w = std::accumulate(cbegin(w), cend(w), 0.0);
         for(auto& x : w) x /= sum_w;

         vector<std::pair<int, real>> sw;
         int lo = 100, hi = 0;
         for(size_t j = 0; j < n; ++j) {
            const int s = score_distrib(gen);
            sw.emplace_back(s, w[j]);
            lo = std::min(lo, s);
            hi = std::max(hi, s);
         }

         const auto overall = weighted_overall(sw);
         CATCH_REQUIRE(overall >= lo);
         CATCH_REQUIRE(overall <= hi);
      }
   }
}

} // namespace formcheck
