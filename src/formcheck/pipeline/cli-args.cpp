#include "cli-args.hpp"

#include "formcheck/assessment/exercise.hpp"
#include "formcheck/io/json-io.hpp"
#include "formcheck/utils/cli-utils.hpp"
#include "formcheck/utils/file-system.hpp"

#define This CliArgs

namespace formcheck::pipeline
{
// ------------------------------------------------------------------- meta data
//
const vector<MemberMetaData>& This::meta_data() const noexcept
{
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(This, STRING, version, true));
      m.push_back(MAKE_META(This, BOOL, show_help, true));
      m.push_back(MAKE_META(This, BOOL, has_error, true));
      m.push_back(MAKE_META(This, STRING, exercise, true));
      m.push_back(MAKE_META(This, STRING, keypoints_fname, true));
      m.push_back(MAKE_META(This, STRING, video_fname, true));
      m.push_back(MAKE_META(This, STRING, params_fname, false));
      m.push_back(MAKE_META(This, STRING, output_fname, false));
      m.push_back(MAKE_META(This, INT, frame_stride, true));
      m.push_back(MAKE_META(This, INT, max_frames, true));
      m.push_back(MAKE_META(This, INT, min_usable_frames, true));
      m.push_back(MAKE_META(This, BOOL, no_summary, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

// ------------------------------------------------------------------- show help
//
void show_help(string argv0) noexcept
{
   AnalysisParams defaults;
   cout << format(R"V0G0N(

   Usage: {} [OPTIONS...] -e <exercise> -k <filename>

      -e <exercise>         One of {}.
      -k <filename>         Keypoint track (json) of landmarks per frame.
      -v <filename>         Video to decode alongside the keypoint track.
                            Without it, the track is replayed directly.
      -p <filename>         Analysis parameters (json). Missing keys take
                            their default values.
      -o <filename>         Write the result here. Default is stdout.

      --stride <n>          Process every nth frame. Default is {}.
      --max-frames <n>      Stop after sampling n frames. Default is {}.
      --min-frames <n>      Frames that must yield the primary angle.
                            Default is {}.
      --no-summary          Omit the one-line summary from the result.

   Exit status is 0 when the analysis succeeds, and 1 otherwise.

   Example:

      # Analyze a squat, printing the result as json
      > {} -e squat -k squat-keypoints.json

)V0G0N",
                  basename(argv0),
                  supported_exercises_str(),
                  defaults.frame_stride,
                  defaults.max_frames,
                  defaults.min_usable_frames,
                  basename(argv0));
}

// ---------------------------------------------------------- parse command line
//
CliArgs parse_command_line(int argc, char** argv) noexcept
{
   CliArgs config;
   auto has_error = false;

   // (*) ---- Search for '-h/--help'
   for(int i = 1; i < argc and !config.show_help; ++i)
      if(strcmp(argv[i], "-h") == 0 or strcmp(argv[i], "--help") == 0)
         config.show_help = true;
   if(config.show_help) return config;

   // (*) ---- Parse command line
   for(int i = 1; i < argc; ++i) {
      const string arg = argv[i];
      try {
         if(arg == "-e"s or arg == "--exercise"s) {
            config.exercise = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-k"s or arg == "--keypoints"s) {
            config.keypoints_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-v"s or arg == "--video"s) {
            config.video_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-p"s or arg == "--params"s) {
            config.params_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-o"s) {
            config.output_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--stride"s) {
            config.frame_stride = cli::safe_arg_positive_int(argc, argv, i);
         } else if(arg == "--max-frames"s) {
            config.max_frames = cli::safe_arg_positive_int(argc, argv, i);
         } else if(arg == "--min-frames"s) {
            config.min_usable_frames = cli::safe_arg_positive_int(argc, argv, i);
         } else if(arg == "--no-summary"s) {
            config.no_summary = true;
         } else {
            cout << format("Unused argument: '{}'", arg) << endl;
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("error on command-line: {}", e.what()) << endl;
         has_error = true;
      }
   }

   // (*) ---- Sanity checks
   if(config.exercise.empty()) {
      cout << format("must specify an exercise with '-e'") << endl;
      has_error = true;
   }

   if(config.keypoints_fname.empty()) {
      cout << format("must specify a keypoint track with '-k'") << endl;
      has_error = true;
   } else if(!is_regular_file(config.keypoints_fname)) {
      cout << format("failed to find keypoint track '{}'",
                     config.keypoints_fname)
           << endl;
      has_error = true;
   }

   if(!config.video_fname.empty() and !is_regular_file(config.video_fname)) {
      cout << format("failed to find video file '{}'", config.video_fname)
           << endl;
      has_error = true;
   }

   // (*) ---- Resolve the analysis parameters
   if(!config.params_fname.empty()) {
      try {
         load(config.params, config.params_fname);
      } catch(std::exception& e) {
         LOG_ERR(format("failed to read params file '{}': {}",
                        config.params_fname,
                        e.what()));
         has_error = true;
      }
   }

   if(config.frame_stride > 0) config.params.frame_stride = config.frame_stride;
   if(config.max_frames > 0) config.params.max_frames = config.max_frames;
   if(config.min_usable_frames > 0)
      config.params.min_usable_frames = config.min_usable_frames;
   if(config.no_summary) config.params.emit_summary = false;

   try {
      config.params.validate();
   } catch(std::runtime_error& e) {
      cout << format("invalid analysis parameters: {}", e.what()) << endl;
      has_error = true;
   }

   config.has_error = has_error;
   return config;
}

} // namespace formcheck::pipeline

#undef This
