#include "stdinc.hpp"

#include "dump-default-params-inc.hpp"

#include "formcheck/pipeline/analysis-params.hpp"
#include "formcheck/utils/cli-utils.hpp"
#include "formcheck/utils/file-system.hpp"

namespace formcheck::dump_default_params
{
// ---------------------------------------------------------------------- brief

string brief() noexcept
{
   return "Dumps the default analysis 'params.json' to file or stdout.";
}

// ---------------------------------------------------------------------- config

struct Config
{
   bool show_help   = false;
   string out_fname = ""s; // empty means stdout
};

// -------------------------------------------------------------------- run main

void show_help(string argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...]

      -o <filename>      File to save the parameters to. Default is stdout.

   Example:

      # Write the defaults, edit them, and pass them to 'analyze -p'
      > {:s} -o /tmp/params.json

)V0G0N",
                  basename(argv0),
                  basename(argv0));
}

int run_main(int argc, char** argv)
{
   Config config;
   auto has_error = false;

   // ---- Parse command line
   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-o"s) {
            config.out_fname = cli::safe_arg_str(argc, argv, i);
         } else {
            cout << format("Unused argument: '{:s}'", arg) << endl;
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         has_error = true;
      }
   }

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   // ---- Action
   const AnalysisParams params;
   if(config.out_fname.empty()) {
      cout << params.to_json_string() << endl;
      return EXIT_SUCCESS;
   }

   bool success = false;
   try {
      save(params, config.out_fname);
      INFO(format("default parameters saved to '{:s}'", config.out_fname));
      success = true;
   } catch(std::exception& e) {
      LOG_ERR(format("failed: {:s}", e.what()));
   }

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace formcheck::dump_default_params
