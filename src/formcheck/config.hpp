#pragma once

#include <string>

namespace Json
{
class Value;
}

namespace formcheck
{
#ifdef TESTCASE_BUILD
constexpr bool k_is_testcase_build = true;
#else
constexpr bool k_is_testcase_build = false;
#endif

constexpr bool k_is_cli_build = !k_is_testcase_build;

#ifdef DEBUG_BUILD
constexpr bool k_is_debug_build = true;
#else
constexpr bool k_is_debug_build = false;
#endif

#ifdef RELEASE_BUILD
constexpr bool k_is_release_build = true;
#else
constexpr bool k_is_release_build = false;
#endif

constexpr const char* k_version = FORMCHECK_VERSION;

// Must be called before any of the functions below
void load_environment_variables() noexcept;

// NOT thread safe
void set_environment_variables(const Json::Value& o) noexcept;

bool formcheck_trace_mode() noexcept;
int formcheck_log_level() noexcept;
bool formcheck_no_colour() noexcept;

std::string environment_info() noexcept;
std::string environment_json_str() noexcept;

} // namespace formcheck
