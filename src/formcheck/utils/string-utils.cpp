#include "string-utils.hpp"

#include "formcheck/foundation.hpp"

namespace formcheck
{
// ---------------------------------------------------------------- upper/lower

string string_to_uppercase(const std::string_view s) noexcept
{
   string o{s};
   for(auto& c : o) c = char(std::toupper(static_cast<unsigned char>(c)));
   return o;
}

string string_to_lowercase(const std::string_view s) noexcept
{
   string o{s};
   for(auto& c : o) c = char(std::tolower(static_cast<unsigned char>(c)));
   return o;
}

} // namespace formcheck
