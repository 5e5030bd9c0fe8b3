#include "stdinc.hpp"

#include "analyze-inc.hpp"

#include "formcheck/pipeline/analyze.hpp"
#include "formcheck/pipeline/cli-args.hpp"
#include "formcheck/pose-source/keypoint-track.hpp"
#include "formcheck/pose-source/video-pose-source.hpp"
#include "formcheck/utils/file-system.hpp"

namespace formcheck::analyze
{
// ------------------------------------------------------------------- run-main
//
static AnalysisOutcome run_analysis(const pipeline::CliArgs& config) noexcept
{
   if(config.video_fname.empty()) {
      KeypointTrackSource source{config.keypoints_fname};
      return analyze_exercise(config.exercise, source, config.params);
   }

   // The estimator serves the track's landmarks to the decoded frames
   KeypointTrack track;
   try {
      track = load_keypoint_track(config.keypoints_fname);
   } catch(std::exception& e) {
      LOG_ERR(format("{}", e.what()));
      return AnalysisOutcome::make_error(AnalysisError::DECODE_FAILURE,
                                         "Could not open video."s);
   }

   TrackPoseEstimator estimator{std::move(track)};
   VideoPoseSource source{config.video_fname, estimator};
   return analyze_exercise(config.exercise, source, config.params);
}

int run_main(int argc, char** argv)
{
   const auto config = pipeline::parse_command_line(argc, argv);

   if(config.show_help) {
      pipeline::show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(config.has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   const auto outcome = run_analysis(config);
   const auto out_s   = outcome.to_string();

   if(config.output_fname.empty()) {
      cout << out_s << endl;
   } else {
      const auto ec = file_put_contents(config.output_fname, out_s);
      if(ec) {
         LOG_ERR(format("failed to write '{}': {}",
                        config.output_fname,
                        ec.message()));
         return EXIT_FAILURE;
      }
      INFO(format("result saved to '{}'", config.output_fname));
   }

   return outcome.success() ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace formcheck::analyze
