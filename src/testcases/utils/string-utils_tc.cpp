#define CATCH_CONFIG_PREFIX_ALL

#include "catch2/catch.hpp"
#include "formcheck/foundation.hpp"
#include "formcheck/utils/string-utils.hpp"

namespace formcheck
{
CATCH_TEST_CASE("TrimAndCase", "[trim-and-case]")
{
   CATCH_SECTION("trim")
   {
      CATCH_REQUIRE(trim_copy("  squat \t\n") == "squat"s);
      CATCH_REQUIRE(trim_copy("") == ""s);
      CATCH_REQUIRE(trim_copy("   ") == ""s);
      CATCH_REQUIRE(trim_copy("push up") == "push up"s);
   }

   CATCH_SECTION("upper-lower")
   {
      CATCH_REQUIRE(string_to_uppercase("l_knee") == "L_KNEE"s);
      CATCH_REQUIRE(string_to_lowercase("Push-Up") == "push-up"s);
      CATCH_REQUIRE(string_to_lowercase("") == ""s);
   }
}

} // namespace formcheck
