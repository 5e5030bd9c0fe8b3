#pragma once

#include <algorithm>
#include <cctype>
#include <cfloat>
#include <charconv>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace formcheck
{
using std::string;
using std::string_view;

// -- Terminal Colours

#define ANSI_COLOUR_RED "\x1b[31m"
#define ANSI_COLOUR_GREEN "\x1b[32m"
#define ANSI_COLOUR_YELLOW "\x1b[33m"
#define ANSI_COLOUR_BLUE "\x1b[34m"
#define ANSI_COLOUR_MAGENTA "\x1b[35m"
#define ANSI_COLOUR_CYAN "\x1b[36m"
#define ANSI_COLOUR_GREY "\x1b[37m"
#define ANSI_COLOUR_WHITE "\x1b[97m"

#define ANSI_COLOUR_RESET "\x1b[0m"

// ---------------------------------------------------------------- lexical-cast
// Integers only: floating point `from_chars` is not everywhere yet.
template<typename I>
std::error_code
lexical_cast(std::string_view s, I& value, int base = 10) noexcept
{
   static_assert(std::is_integral<I>::value);
   const auto [ptr, ec]
       = std::from_chars(s.data(), s.data() + s.size(), value, base);
   if(ec == std::errc() && ptr != s.data() + s.size())
      return std::make_error_code(std::errc::invalid_argument);
   return std::make_error_code(ec);
}

// -------------------------------------------------------------------- str shim

// Helper function
namespace detail
{
   template<typename T> string format_(const char* fmt, const T& v)
   {
      constexpr int k_size = 32;
      char buffer[k_size];
      int written = snprintf(buffer, k_size, fmt, v);
      if(written < k_size - 1) return string(buffer);
      // We never do this in our str(...) functions
      std::unique_ptr<char[]> b2(new char[size_t(written + 1)]);
      snprintf(b2.get(), size_t(written + 1), fmt, v);
      return string(b2.get());
   }

} // namespace detail

// strings
inline string& str(string& s) { return s; }
inline const string& str(const string& s) { return s; }

// Basic types
inline string str(bool v) { return v ? "true" : "false"; }
inline string str(char c) { return string(1, c); }
inline string str(int v) { return detail::format_<int>("%d", v); }
inline string str(unsigned int v)
{
   return detail::format_<unsigned int>("%u", v);
}
inline string str(long int v) { return detail::format_<long int>("%ld", v); }
inline string str(unsigned long int v)
{
   return detail::format_<unsigned long int>("%lu", v);
}
inline string str(float v)
{
   return detail::format_<double>("%f", static_cast<double>(v));
}
inline string str(double v) { return detail::format_<double>("%f", v); }
inline string str(const char* p) { return string(p); }
inline string str(const string_view s) { return string(s); }

// --------------------------------------------------------------------- Implode

template<typename InputIt, typename F>
string implode(InputIt first, InputIt last, const std::string_view glue, F f)
{
   std::stringstream stream("");
   bool start = true;
   while(first != last) {
      if(start)
         start = false;
      else
         stream << glue;
      stream << str(f(*first++));
   }
   return stream.str();
}

template<typename InputIt>
string implode(InputIt first, InputIt last, const std::string_view glue)
{
   auto f = [](const decltype(*first)& v) -> std::string { return str(v); };
   return implode(first, last, glue, f);
}

// ------------------------------------------------------------------------ Trim

inline void ltrim(std::string& s)
{
   s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
              return !std::isspace(ch);
           }));
}

// trim from end (in place)
inline void rtrim(std::string& s)
{
   s.erase(std::find_if(
               s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); })
               .base(),
           s.end());
}

// trim from both ends (in place)
inline void trim(std::string& s)
{
   ltrim(s);
   rtrim(s);
}

inline string trim_copy(const std::string_view s)
{
   string ret{s};
   trim(ret);
   return ret;
}

// --------------------------------------------------------- synchronized output

inline void sync_write(std::function<void()> thunk)
{
   static std::mutex padlock;
   std::lock_guard<decltype(padlock)> lock(padlock);
   // This thunk should do the writing to cout, or whatever nees to be
   // synchronised.
   thunk();
}

inline void sync_write(std::ostream& os, const std::string& s)
{
   sync_write([&]() {
      os << s;
      os.flush();
   });
}

// ---------------------------------------------------------------- upper/lower

string string_to_uppercase(const std::string_view s) noexcept;
string string_to_lowercase(const std::string_view s) noexcept;

} // namespace formcheck
