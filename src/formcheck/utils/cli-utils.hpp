#pragma once

#include "formcheck/foundation.hpp"

namespace formcheck::cli
{
inline string safe_arg_str(int argc, char** argv, int& i) noexcept(false)
{
   auto arg = argv[i];
   ++i;
   if(i >= argc) {
      auto msg = format("expected string after argument '{}'", arg);
      throw std::runtime_error(msg);
   }
   return string(argv[i]);
}

inline int safe_arg_int(int argc, char** argv, int& i) noexcept(false)
{
   auto arg = argv[i];
   ++i;
   auto badness = (i >= argc);
   auto ret     = 0;

   if(!badness) {
      char* end = nullptr;
      ret       = int(strtol(argv[i], &end, 10));
      if(*end != '\0' or end == argv[i]) badness = true;
   }

   if(badness) {
      auto msg = format("expected integer after argument '{}'", arg);
      throw std::runtime_error(msg);
   }

   return ret;
}

inline int
safe_arg_positive_int(int argc, char** argv, int& i) noexcept(false)
{
   const auto arg = argv[i];
   const auto ret = safe_arg_int(argc, argv, i);
   if(ret < 1)
      throw std::runtime_error(format(
          "expected a positive integer after argument '{}', got {}", arg, ret));
   return ret;
}

} // namespace formcheck::cli
