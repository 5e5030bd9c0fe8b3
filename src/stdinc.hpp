#ifndef FORMCHECK_STDINC_HPP
#define FORMCHECK_STDINC_HPP

// Keep this small
#include "formcheck/foundation.hpp"

#ifdef __cplusplus

#include "formcheck/utils/math.hpp"
#include "formcheck/utils/string-utils.hpp"
#include "formcheck/utils/tick-tock.hpp"

#include "formcheck/geometry/vector-2.hpp"

#endif

#endif
