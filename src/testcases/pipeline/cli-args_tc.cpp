#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include "formcheck/pipeline/cli-args.hpp"
#include "formcheck/utils/file-system.hpp"

static const bool feedback = false;

namespace formcheck::pipeline
{
static CliArgs parse_args(vector<string> args)
{
   args.insert(begin(args), "formcheck-cli"s);
   vector<char*> argv;
   for(auto& arg : args) argv.push_back(&arg[0]);
   return parse_command_line(int(argv.size()), argv.data());
}

CATCH_TEST_CASE("CliArgs", "[cli-args]")
{
   const string track_fname  = "/tmp/formcheck-cli-track.test.json";
   const string params_fname = "/tmp/formcheck-cli-params.test.json";
   CATCH_REQUIRE(!file_put_contents(track_fname, R"({"frames": []})"));
   CATCH_REQUIRE(!file_put_contents(params_fname,
                                    R"({"frame_stride": 2, "max_frames": 9})"));

   CATCH_SECTION("minimal")
   {
      const auto config = parse_args({"-e", "squat", "-k", track_fname});
      CATCH_REQUIRE(!config.has_error);
      CATCH_REQUIRE(!config.show_help);
      CATCH_REQUIRE(config.exercise == "squat");
      CATCH_REQUIRE(config.keypoints_fname == track_fname);
      CATCH_REQUIRE(config.output_fname.empty());
      CATCH_REQUIRE(config.params == AnalysisParams{});
      if(feedback) cout << str(config) << endl;
   }

   CATCH_SECTION("help")
   {
      CATCH_REQUIRE(parse_args({"--help"}).show_help);
      CATCH_REQUIRE(parse_args({"-e", "squat", "-h"}).show_help);
   }

   CATCH_SECTION("params-and-overrides")
   {
      const auto config = parse_args({"--exercise",
                                      "lunge",
                                      "--keypoints",
                                      track_fname,
                                      "-p",
                                      params_fname,
                                      "--max-frames",
                                      "20",
                                      "--no-summary",
                                      "-o",
                                      "/tmp/out.json"});
      CATCH_REQUIRE(!config.has_error);
      CATCH_REQUIRE(config.params.frame_stride == 2);  // from the file
      CATCH_REQUIRE(config.params.max_frames == 20);   // overridden
      CATCH_REQUIRE(config.params.min_usable_frames == 3); // default
      CATCH_REQUIRE(!config.params.emit_summary);
      CATCH_REQUIRE(config.output_fname == "/tmp/out.json");
   }

   CATCH_SECTION("errors")
   {
      CATCH_REQUIRE(parse_args({"-k", track_fname}).has_error);
      CATCH_REQUIRE(parse_args({"-e", "squat"}).has_error);
      CATCH_REQUIRE(
          parse_args({"-e", "squat", "-k", "/tmp/no-such-track.json"})
              .has_error);
      CATCH_REQUIRE(
          parse_args({"-e", "squat", "-k", track_fname, "--stride", "0"})
              .has_error);
      CATCH_REQUIRE(
          parse_args({"-e", "squat", "-k", track_fname, "--stride", "x"})
              .has_error);
      CATCH_REQUIRE(
          parse_args({"-e", "squat", "-k", track_fname, "--bogus"}).has_error);
      CATCH_REQUIRE(parse_args({"-e", "squat", "-k", track_fname, "-e"})
                        .has_error);
      CATCH_REQUIRE(parse_args({"-e",
                                "squat",
                                "-k",
                                track_fname,
                                "-v",
                                "/tmp/no-such-video.mp4"})
                        .has_error);
   }

   delete_file(track_fname);
   delete_file(params_fname);
}

} // namespace formcheck::pipeline
