#include <algorithm>
#include <random>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/assessment/metric-series.hpp"
#include "formcheck/utils/math.hpp"

static const bool feedback = false;

namespace formcheck
{
CATCH_TEST_CASE("Percentiles", "[percentiles]")
{
   CATCH_SECTION("linear-interpolation")
   {
      const vector<real> xs = {1.0, 2.0, 3.0, 4.0, 5.0};
      CATCH_REQUIRE(calc_percentile(xs, 0.0) == Approx(1.0));
      CATCH_REQUIRE(calc_percentile(xs, 100.0) == Approx(5.0));
      CATCH_REQUIRE(calc_percentile(xs, 10.0) == Approx(1.4));
      CATCH_REQUIRE(calc_percentile(xs, 90.0) == Approx(4.6));
      CATCH_REQUIRE(calc_median(xs) == Approx(3.0));

      // Even count: the two middle values are averaged
      CATCH_REQUIRE(calc_median(vector<real>{4.0, 1.0, 3.0, 2.0})
                    == Approx(2.5));

      CATCH_REQUIRE(calc_percentile(vector<real>{7.0}, 10.0) == Approx(7.0));
   }

   CATCH_SECTION("empty-is-zero")
   {
      const vector<real> xs;
      CATCH_REQUIRE(calc_percentile(xs, 10.0) == 0.0);
      CATCH_REQUIRE(calc_median(xs) == 0.0);
      CATCH_REQUIRE(calc_stddev(xs) == 0.0);
      for(auto kind : {SummaryKind::MEDIAN,
                       SummaryKind::P10,
                       SummaryKind::P90,
                       SummaryKind::STDDEV})
         CATCH_REQUIRE(MetricSeries{"x", kind}.summary() == 0.0);
   }

   CATCH_SECTION("order-invariant")
   {
      std::mt19937 gen(3);
      std::uniform_real_distribution<real> distrib(0.0, 180.0);
      vector<real> xs(37);
      for(auto& x : xs) x = distrib(gen);

      const auto p10 = calc_percentile(xs, 10.0);
      const auto med = calc_median(xs);
      const auto p90 = calc_percentile(xs, 90.0);
      const auto sd  = calc_stddev(xs);
      for(auto i = 0; i < 20; ++i) {
         std::shuffle(begin(xs), end(xs), gen);
         CATCH_REQUIRE(calc_percentile(xs, 10.0) == p10);
         CATCH_REQUIRE(calc_median(xs) == med);
         CATCH_REQUIRE(calc_percentile(xs, 90.0) == p90);
         CATCH_REQUIRE(calc_stddev(xs) == Approx(sd));
      }
      CATCH_REQUIRE(p10 <= med);
      CATCH_REQUIRE(med <= p90);
      if(feedback)
         cout << format("p10 = {}, median = {}, p90 = {}", p10, med, p90)
              << endl;
   }

   CATCH_SECTION("stddev")
   {
      // Population standard deviation
      const vector<real> xs = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
      CATCH_REQUIRE(calc_stddev(xs) == Approx(2.0));
      CATCH_REQUIRE(calc_stddev(vector<real>{3.0, 3.0, 3.0}) == 0.0);
   }
}

CATCH_TEST_CASE("MetricSeries", "[metric-series]")
{
   CATCH_SECTION("absent-values-are-skipped")
   {
      MetricSeries s{"knee", SummaryKind::P10};
      CATCH_REQUIRE(s.push(120.0));
      CATCH_REQUIRE(!s.push(std::nullopt));
      CATCH_REQUIRE(!s.push(dNAN));
      CATCH_REQUIRE(s.push(90.0));
      CATCH_REQUIRE(s.size() == 2);
      CATCH_REQUIRE(s.summary() == Approx(93.0));
      CATCH_REQUIRE(!s.to_string().empty());
   }

   CATCH_SECTION("summary-kind-names")
   {
      CATCH_REQUIRE(to_summary_kind(str(SummaryKind::P90)) == SummaryKind::P90);
      CATCH_REQUIRE_THROWS(to_summary_kind("P50"));
   }
}

} // namespace formcheck
