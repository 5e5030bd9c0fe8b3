#pragma once

#include "fmt/format.h"
#include "string-utils.hpp"
#include <iostream>
#include <mutex>

#ifdef DEBUG_BUILD
#define DLOG(m) \
   ::formcheck::Logger::report(0, __FILE__, __LINE__, ::formcheck::str(m))
#else
#define DLOG(m)
#endif

#define INFO(m)                          \
   if(::formcheck::get_log_level() <= 1) \
   ::formcheck::Logger::report(1, __FILE__, __LINE__, ::formcheck::str(m))
#define WARN(m)                          \
   if(::formcheck::get_log_level() <= 2) \
   ::formcheck::Logger::report(2, __FILE__, __LINE__, ::formcheck::str(m))
#define LOG_ERR(m)                       \
   if(::formcheck::get_log_level() <= 3) \
   ::formcheck::Logger::report(3, __FILE__, __LINE__, ::formcheck::str(m))
#define FATAL(m) \
   ::formcheck::Logger::report(4, __FILE__, __LINE__, ::formcheck::str(m))
#define TRACE(m)                           \
   if(::formcheck::formcheck_trace_mode()) \
   ::formcheck::Logger::report(5, __FILE__, __LINE__, ::formcheck::str(m))

namespace formcheck
{
using fmt::format;
using std::string;

bool formcheck_trace_mode() noexcept; // config.cpp

inline void logger_enable_colours(bool value);
inline bool logger_colours_enabled();

inline int get_log_level();
inline void set_log_level(int level);
inline void set_log_info();  // 1
inline void set_log_warn();  // 2
inline void set_log_error(); // 3
// Fatal is always logged

class Logger;

} // namespace formcheck

// -------------------------------------------------------------- Implementation

namespace formcheck
{
class Logger
{
 private:
   static Logger* instance()
   {
      static Logger instance_; // This is now thread-safe in C++11
      return &instance_;
   }

   static const char* level_to_string(int level)
   {
      if(colours_enabled()) {
         switch(level) {
         case 0: return ANSI_COLOUR_CYAN "DEBUG" ANSI_COLOUR_RESET;
         case 1: return ANSI_COLOUR_BLUE "INFO " ANSI_COLOUR_RESET;
         case 2: return ANSI_COLOUR_YELLOW "WARN " ANSI_COLOUR_RESET;
         case 3: return ANSI_COLOUR_RED "ERROR" ANSI_COLOUR_RESET;
         case 4: return ANSI_COLOUR_RED "FATAL" ANSI_COLOUR_RESET;
         case 5:
            return "\x1b[42m\x1b[97m"
                   "TRACE" ANSI_COLOUR_RESET;
         default: break;
         }
      } else {
         switch(level) {
         case 0: return "DEBUG";
         case 1: return "INFO ";
         case 2: return "WARN ";
         case 3: return "ERROR";
         case 4: return "FATAL";
         case 5: return "TRACE";
         default: break;
         }
      }
      return "?";
   }

   bool colours_  = true;
   int log_level_ = 0;

   Logger()  = default;
   ~Logger() = default;

 public:
   // Log lines go to stderr, leaving stdout for results
   static void
   report(int level, const char* file, int lineno, const string& msg)
   {
      if((level >= log_level() && level <= 5) || level == 0) {
         std::ostream& out = std::clog;
         sync_write([&]() {
            if(colours_enabled())
               out << level_to_string(level) << " " << ANSI_COLOUR_GREY
                   << file << ":" << lineno << ANSI_COLOUR_RESET << " " << msg
                   << "\n";
            else
               out << level_to_string(level) << " " << file << ":" << lineno
                   << " " << msg << "\n";
         });
         if(level == 4) {
            exit(1); // Die on fatal
         }
      }
   }

   static int log_level() { return instance()->log_level_; }

   static void set_log_level(int level)
   {
      if(level > 0 && level <= 5)
         instance()->log_level_ = level;
      else
         report(
             2, __FILE__, __LINE__, format("Invalid log level: {}", level));
   }

   static bool colours_enabled() { return instance()->colours_; }

   static void enable_colours(bool value) { instance()->colours_ = value; }
};

} // namespace formcheck

inline int ::formcheck::get_log_level()
{
   return ::formcheck::Logger::log_level();
}
inline void ::formcheck::set_log_level(int level)
{
   ::formcheck::Logger::set_log_level(level);
}
inline void ::formcheck::set_log_info()
{
   ::formcheck::Logger::set_log_level(1);
}
inline void ::formcheck::set_log_warn()
{
   ::formcheck::Logger::set_log_level(2);
}
inline void ::formcheck::set_log_error()
{
   ::formcheck::Logger::set_log_level(3);
}

inline void ::formcheck::logger_enable_colours(bool value)
{
   ::formcheck::Logger::enable_colours(value);
}
inline bool ::formcheck::logger_colours_enabled()
{
   return ::formcheck::Logger::colours_enabled();
}
