#pragma once

#include "config.hpp"

// ------------------------------------------------------------- Likely/unlikely

#if defined(__clang__) || defined(__GNUC__)
#define branch_is_likely(x) __builtin_expect(!!(x), 1)
#define branch_is_unlikely(x) __builtin_expect(!!(x), 0)
#else
#define branch_is_likely(x) (!!(x))
#define branch_is_unlikely(x) (!!(x))
#endif

// -------------------------------------------------------------- C/C++ Includes

#ifndef __cplusplus
#error "this is a c++ only include"
#endif

// C includes
#include <assert.h>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
// C++ includes
#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <unordered_map>
#include <unordered_set>

// ------------------------------------------------------------------ Beyond std

#include "fmt/format.h"
#include "range/v3/all.hpp"

// ----------------------------------------------------------- Formcheck headers

#include "utils/logger.hpp"

namespace views   = ranges::views;
namespace actions = ranges::actions;

namespace formcheck
{
using fmt::format;

using std::array;
using std::string;
using std::string_view;
using std::vector;

using std::cout;
using std::endl;

using std::cbegin;
using std::cend;

using namespace std::string_literals;

using real = double;

// -------------------------------------------------------------------- Aliasing

// -- Adjust GSL Expects and Ensures macros
#ifdef Expects
#undef Expects
#endif
#define Expects(cond)                  \
   {                                   \
      if(!branch_is_likely(cond)) {    \
         assert(false);                \
         FATAL("Precondition failed"); \
      }                                \
   }

#ifdef Ensures
#undef Ensures
#endif
#define Ensures(cond)                   \
   {                                    \
      if(!branch_is_likely(cond)) {     \
         assert(false);                 \
         FATAL("Postcondition failed"); \
      }                                 \
   }

using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;

template<class Key, class T> using hashmap = std::unordered_map<Key, T>;
template<class Key> using hashset          = std::unordered_set<Key>;

} // namespace formcheck
