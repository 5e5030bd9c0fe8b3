#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/assessment/exercise.hpp"
#include "formcheck/assessment/feedback.hpp"

static const bool feedback = false;

namespace formcheck
{
static ExerciseDefinition make_two_group_definition()
{
   ExerciseDefinition def;
   def.name = "test";

   MetricGroup a;
   a.key         = "alpha";
   a.metric      = "alpha_median";
   a.table       = make_lower_is_better({{10.0, 95}, {20.0, 70}}, 50);
   a.weight      = 0.6;
   a.praise      = "Alpha is good.";
   a.issue       = "Alpha issue";
   a.instruction = "Fix alpha.";
   a.feedback    = [](real x) { return format("alpha = {:.1f}", x); };
   a.breakdown   = [](real x) { return format("alpha was {:.1f}", x); };

   MetricGroup b;
   b.key         = "beta";
   b.metric      = "beta_p90";
   b.table       = make_higher_is_better({{30.0, 95}, {20.0, 65}}, 50);
   b.weight      = 0.4;
   b.policy      = SeverityPolicy::ALWAYS_INFO;
   b.praise      = "Beta is good.";
   b.issue       = "Beta issue";
   b.instruction = "Fix beta.";

   def.groups           = {a, b};
   def.correction_order = {"beta", "alpha"};
   def.improvement_tips = {"tip"};
   return def;
}

CATCH_TEST_CASE("AssembleResult", "[assemble-result]")
{
   const auto def = make_two_group_definition();
   CATCH_REQUIRE(def.total_weight() == Approx(1.0));
   CATCH_REQUIRE(def.find_group("beta") != nullptr);
   CATCH_REQUIRE(def.find_group("gamma") == nullptr);

   CATCH_SECTION("all-good")
   {
      const auto r = assemble_result(def, {{"alpha_median", 5.0},
                                           {"beta_p90", 40.0}});
      CATCH_REQUIRE(r.exercise == "test");
      CATCH_REQUIRE(r.overall_score == 95);
      CATCH_REQUIRE(r.corrections.empty());
      CATCH_REQUIRE(r.whats_right
                    == vector<string>{"Alpha is good.", "Beta is good."});
      CATCH_REQUIRE(r.breakdown.size() == 2);
      CATCH_REQUIRE(r.breakdown[0].group == "alpha");
      CATCH_REQUIRE(r.breakdown[0].feedback == "alpha was 5.0");
      CATCH_REQUIRE(r.breakdown[1].feedback.empty());
      CATCH_REQUIRE(r.improvement_tips == vector<string>{"tip"});
      CATCH_REQUIRE(r.metrics.size() == 2);
   }

   CATCH_SECTION("corrections-in-priority-order")
   {
      // alpha => 70 (warning), beta => 65 (info, mobility-type)
      const auto r = assemble_result(def, {{"alpha_median", 15.0},
                                           {"beta_p90", 25.0}});
      CATCH_REQUIRE(r.overall_score == 68); // 0.6*70 + 0.4*65
      CATCH_REQUIRE(r.whats_right.empty());
      CATCH_REQUIRE(r.corrections.size() == 2);
      CATCH_REQUIRE(r.corrections[0].issue == "Beta issue");
      CATCH_REQUIRE(r.corrections[0].severity == Severity::INFO);
      CATCH_REQUIRE(r.corrections[1].issue == "Alpha issue");
      CATCH_REQUIRE(r.corrections[1].severity == Severity::WARNING);
      CATCH_REQUIRE(r.corrections[1].feedback == "alpha = 15.0");
      CATCH_REQUIRE(r.corrections[1].correction_instruction == "Fix alpha.");
      if(feedback) cout << str(r) << endl;
   }

   CATCH_SECTION("critical-below-60")
   {
      const auto r = assemble_result(def, {{"alpha_median", 25.0},
                                           {"beta_p90", 10.0}});
      CATCH_REQUIRE(r.overall_score == 50);
      const auto c = r.find_correction("Alpha issue");
      CATCH_REQUIRE(c != nullptr);
      CATCH_REQUIRE(c->severity == Severity::CRITICAL);
      CATCH_REQUIRE(r.find_correction("Beta issue")->severity
                    == Severity::INFO);
   }

   CATCH_SECTION("missing-metric-scores-zero")
   {
      // alpha = 0.0 => 95; beta = 0.0 => 50
      const auto r = assemble_result(def, {});
      CATCH_REQUIRE(r.find_subscore("alpha")->score == 95);
      CATCH_REQUIRE(r.find_subscore("beta")->score == 50);
      CATCH_REQUIRE(r.find_subscore("gamma") == nullptr);
   }
}

CATCH_TEST_CASE("SummarySentence", "[summary-sentence]")
{
   CATCH_REQUIRE(summary_sentence(95, 0)
                 == "Excellent form! Minor adjustments can make it perfect.");
   CATCH_REQUIRE(summary_sentence(90, 1)
                 == "Excellent form! Minor adjustments can make it perfect.");
   CATCH_REQUIRE(summary_sentence(84, 1)
                 == "Good form with some areas for improvement.");
   CATCH_REQUIRE(summary_sentence(70, 2)
                 == "Fair form. Focus on the corrections below.");
   CATCH_REQUIRE(summary_sentence(69, 3)
                 == "Needs work. Focus on these 3 key areas to improve "
                    "safety and effectiveness.");
}

CATCH_TEST_CASE("ExerciseDefinitions", "[exercise-definitions]")
{
   CATCH_SECTION("weights-sum-to-one")
   {
      for(auto kind :
          {ExerciseKind::SQUAT, ExerciseKind::PUSHUP, ExerciseKind::LUNGE}) {
         const auto& def = definition_of(kind);
         CATCH_REQUIRE(def.name == str(kind));
         CATCH_REQUIRE(def.total_weight() == Approx(1.0));
         CATCH_REQUIRE(def.correction_order.size() == def.groups.size());
         for(const auto& key : def.correction_order)
            CATCH_REQUIRE(def.find_group(key) != nullptr);
         CATCH_REQUIRE(!def.insufficient_message.empty());
         CATCH_REQUIRE(!def.improvement_tips.empty());
      }
   }

   CATCH_SECTION("overall-within-subscore-range")
   {
      // Every metric at 0.0, then every metric very large
      for(auto kind :
          {ExerciseKind::SQUAT, ExerciseKind::PUSHUP, ExerciseKind::LUNGE}) {
         const auto& def = definition_of(kind);
         for(const real x : {0.0, 1.0e6}) {
            MetricSummaries m;
            for(const auto& g : def.groups) m.emplace_back(g.metric, x);
            const auto r = assemble_result(def, m);
            CATCH_REQUIRE(r.overall_score >= 50);
            CATCH_REQUIRE(r.overall_score <= 95);
            for(const auto& s : r.breakdown) {
               CATCH_REQUIRE(s.score >= 50);
               CATCH_REQUIRE(s.score <= 95);
            }
         }
      }
   }

   CATCH_SECTION("parse-exercise")
   {
      CATCH_REQUIRE(parse_exercise("squat") == ExerciseKind::SQUAT);
      CATCH_REQUIRE(parse_exercise(" Squat ") == ExerciseKind::SQUAT);
      CATCH_REQUIRE(parse_exercise("PUSH-UP") == ExerciseKind::PUSHUP);
      CATCH_REQUIRE(parse_exercise("push_up") == ExerciseKind::PUSHUP);
      CATCH_REQUIRE(parse_exercise("lunge") == ExerciseKind::LUNGE);
      CATCH_REQUIRE(!parse_exercise("burpee").has_value());
      CATCH_REQUIRE(!parse_exercise("").has_value());
      CATCH_REQUIRE(supported_exercises_str()
                    == "'squat', 'pushup' or 'lunge'");

      for(auto kind :
          {ExerciseKind::SQUAT, ExerciseKind::PUSHUP, ExerciseKind::LUNGE})
         CATCH_REQUIRE(kind_of(make_exercise_model(kind)) == kind);
   }
}

} // namespace formcheck
