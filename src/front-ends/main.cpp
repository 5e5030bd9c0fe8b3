
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

#include "stdinc.hpp"

#include "formcheck/utils/file-system.hpp"

#include "analyze/analyze-inc.hpp"
#include "dump-default-params/dump-default-params-inc.hpp"

using namespace formcheck;
using namespace std::string_literals;

// ------------------------------------------------------------------------ Runs

static auto make_runs()
{
   std::unordered_map<std::string, std::function<int(int, char**)>> r;
   std::unordered_map<std::string, std::function<std::string()>> b;

#define REGISTER(z)                    \
   {                                   \
      r[#z] = formcheck::z ::run_main; \
      b[#z] = formcheck::z ::brief;    \
   }

   // -- register -- "main" functions
   REGISTER(analyze);
   REGISTER(dump_default_params);

#undef REGISTER

   return make_pair(r, b);
}

// ------------------------------------------------------------------- show-help

static void show_help(const char* arg0)
{
   std::unordered_map<std::string, std::function<int(int, char**)>> runs;
   std::unordered_map<std::string, std::function<std::string()>> briefs;

   std::tie(runs, briefs) = make_runs();

   std::vector<std::string> names;
   for(const auto& ii : runs) names.push_back(ii.first);
   std::sort(names.begin(), names.end());

   auto f = [&](const string& s) {
      auto ii        = briefs.find(s);
      std::string bb = ""s;
      if(ii == cend(briefs)) {
         WARN(format("failed to find brief of '{:s}'", s));
      } else {
         bb = ii->second();
      }
      const int sz = 25 - int(s.size());
      std::string spaces(size_t(std::max(sz, 1)), ' ');

      return format("{:s}{:s}    {:s}", s, spaces, bb);
   };

   cout << format(R"V0G0N(

   Usage: {:s} [-h] [runs...]

      Run can be one of:

      {:s}

   Version: {:s}

)V0G0N",
                  formcheck::basename(arg0),
                  implode(names.begin(), names.end(), "\n      ", f),
                  k_version);
}

// ------------------------------------------------------------------------ main

int main(int argc, char** argv)
{
   if(argc < 2) {
      cout << "Type -h for help" << endl;
      return EXIT_FAILURE;
   }

   const std::string arg = argv[1];
   if(arg == "--help"s || arg == "-h") {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   auto [runs, briefs] = make_runs();

   if(runs.find(arg) == runs.end()) {
      WARN(formcheck::format("Failed to find run '{:s}'", arg));
      return EXIT_FAILURE;
   }

   // Init environment variables
   formcheck::load_environment_variables();

   // Now "shift" argv[0] to argv[1]
   return runs.find(arg)->second(argc - 1, &argv[1]);
}
