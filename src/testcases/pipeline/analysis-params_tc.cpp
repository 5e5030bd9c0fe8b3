#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/io/json-io.hpp"
#include "formcheck/pipeline/analysis-params.hpp"
#include "formcheck/utils/file-system.hpp"

static const bool feedback = false;

namespace formcheck
{
CATCH_TEST_CASE("AnalysisParams", "[analysis-params]")
{
   CATCH_SECTION("defaults")
   {
      const AnalysisParams p;
      CATCH_REQUIRE(p.frame_stride == 3);
      CATCH_REQUIRE(p.max_frames == 600);
      CATCH_REQUIRE(p.min_usable_frames == 3);
      CATCH_REQUIRE(p.default_frame_width == 1920);
      CATCH_REQUIRE(p.default_frame_height == 1080);
      CATCH_REQUIRE(p.emit_summary);
      CATCH_REQUIRE_NOTHROW(p.validate());
      if(feedback) cout << str(p) << endl;
   }

   CATCH_SECTION("read-write")
   {
      AnalysisParams p, q;
      p.frame_stride = 1;
      p.max_frames   = 42;
      p.emit_summary = false;

      string s;
      write(p, s);
      read(q, s);
      CATCH_REQUIRE(p == q);
      CATCH_REQUIRE(q.max_frames == 42);

      q.min_usable_frames = 9;
      CATCH_REQUIRE(p != q);
   }

   CATCH_SECTION("missing-keys-take-defaults")
   {
      AnalysisParams p;
      read(p, R"({"frame_stride": 5})"s);
      CATCH_REQUIRE(p.frame_stride == 5);
      CATCH_REQUIRE(p.max_frames == 600);
      CATCH_REQUIRE(p.emit_summary);
   }

   CATCH_SECTION("load-save")
   {
      const string fname = "/tmp/formcheck-params.test.json";
      AnalysisParams p, q;
      p.min_usable_frames = 7;
      save(p, fname);
      load(q, fname);
      CATCH_REQUIRE(q.min_usable_frames == 7);
      CATCH_REQUIRE(p == q);
      delete_file(fname);
   }

   CATCH_SECTION("validate")
   {
      AnalysisParams p;
      p.frame_stride = 0;
      CATCH_REQUIRE_THROWS(p.validate());

      p              = AnalysisParams{};
      p.max_frames   = -3;
      CATCH_REQUIRE_THROWS(p.validate());

      p                     = AnalysisParams{};
      p.default_frame_width = 0;
      CATCH_REQUIRE_THROWS(p.validate());
   }
}

} // namespace formcheck
