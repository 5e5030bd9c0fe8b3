#include "config.hpp"

#include "stdinc.hpp"

#include "json/json.h"

#include <stdlib.h>

#include <mutex>

namespace formcheck
{
struct EnvironmentVariables
{
   bool is_init        = false;
   bool trace_mode     = false;
   int log_level       = 1;
   bool no_colour      = false;
   Json::Value env_obj = Json::Value{Json::nullValue};

   string make_config_info_str();
   void init_config(const Json::Value& o);
};

static EnvironmentVariables env_vars_;

static void init_instance(const Json::Value& o) noexcept
{
   env_vars_.init_config(o);
}

static EnvironmentVariables& instance()
{
   if(!env_vars_.is_init)
      FATAL(format("Must call 'load_environment_variables()' before attempting "
                   "to load any environmental variables"));
   return env_vars_;
}

// -------------------------------------------------------- make config info str
//
string EnvironmentVariables::make_config_info_str()
{
   auto make_build_str = []() {
      std::stringstream ss{""};
      bool needs_comma = false;
      auto push_ss     = [&](const string_view s) {
         if(needs_comma) ss << ", ";
         ss << s;
         needs_comma = true;
      };
      auto push_bool = [&](bool val, const string_view s) {
         if(val) push_ss(s);
      };
      push_bool(k_is_cli_build, "cli");
      push_bool(k_is_testcase_build, "testcases");
      push_bool(k_is_debug_build, "debug");
      push_bool(k_is_release_build, "release");
      return ss.str();
   };

   return format(R"V0G0N(
   k-formcheck-version           = '{}'
   build-configuration           =  {}
   FORMCHECK_TRACE_MODE          =  {}
   FORMCHECK_LOG_LEVEL           =  {}
   FORMCHECK_NO_COLOUR           =  {}
)V0G0N",
                 k_version,
                 make_build_str(),
                 str(trace_mode),
                 log_level,
                 str(no_colour));
}

// -------------------------------------------------------------------- read-env
//
static Json::Value read_env()
{
   Json::Value o{Json::objectValue};

   auto get_w_default
       = [&o](const std::string_view name,
              const std::string_view default_value) -> std::string {
      const char* ss = getenv(string(name).c_str());
      const auto ret
          = (ss == nullptr) ? std::string(default_value) : std::string(ss);
      o[string(name)] = ret;
      return ret;
   };

   auto get_bool_w_default = [&](const std::string_view name) -> bool {
      const auto val  = get_w_default(name, "");
      const auto ret  = (val == std::string("1") or val == std::string("true"));
      o[string(name)] = ret;
      return ret;
   };

   auto get_int_w_default = [&](const std::string_view name, int def) -> int {
      const auto s = trim_copy(get_w_default(name, ""));
      int ret      = def;
      if(s.size() > 0) {
         int val = 0;
         if(lexical_cast(s, val)) {
            WARN(format("failed to read environment variable {}='{}' as an "
                        "integer, using default value {}",
                        name,
                        s,
                        def));
         } else {
            ret = val;
         }
      }
      o[string(name)] = ret;
      return ret;
   };

   get_bool_w_default("FORMCHECK_TRACE_MODE");
   get_int_w_default("FORMCHECK_LOG_LEVEL", 1);
   get_bool_w_default("FORMCHECK_NO_COLOUR");

   return o;
}

static const Json::Value& get_env_data()
{
   static std::mutex padlock_;
   static bool first_run_ = true;
   static Json::Value env_data_;
   {
      std::lock_guard<decltype(padlock_)> lock(padlock_);
      if(first_run_) {
         env_data_  = read_env();
         first_run_ = false;
      }
   }

   return env_data_;
}

// ----------------------------------------------------------------- init config
//
void EnvironmentVariables::init_config(const Json::Value& o)
{
   auto get_int = [&o](const char* key, int def) {
      return o[key].isInt() ? o[key].asInt() : def;
   };

   trace_mode = o["FORMCHECK_TRACE_MODE"].asBool();
   log_level  = get_int("FORMCHECK_LOG_LEVEL", 1);
   no_colour  = o["FORMCHECK_NO_COLOUR"].asBool();
   env_obj    = o;

   if(log_level < 1 or log_level > 5) {
      WARN(format("FORMCHECK_LOG_LEVEL must be in [1..5], got {}", log_level));
      log_level = 1;
   }

   set_log_level(log_level);
   logger_enable_colours(!no_colour);

   is_init = true;
}

// -------------------------------------------------- load environment variables
//
void load_environment_variables() noexcept { init_instance(get_env_data()); }

void set_environment_variables(const Json::Value& o) noexcept
{
   init_instance(o);
}

// --------------------------------------------------------------------- getters
//
bool formcheck_trace_mode() noexcept
{
   // Logging may happen before the environment is loaded
   return env_vars_.is_init and env_vars_.trace_mode;
}

int formcheck_log_level() noexcept { return instance().log_level; }

bool formcheck_no_colour() noexcept { return instance().no_colour; }

// ---------------------------------------------------------- configuration-info
//
string environment_info() noexcept { return instance().make_config_info_str(); }

std::string environment_json_str() noexcept
{
   std::stringstream ss{""};
   ss << instance().env_obj;
   return ss.str();
}

} // namespace formcheck
