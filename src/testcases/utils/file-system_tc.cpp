#define CATCH_CONFIG_PREFIX_ALL

#include "catch2/catch.hpp"
#include "formcheck/foundation.hpp"
#include "formcheck/utils/file-system.hpp"

namespace formcheck
{
CATCH_TEST_CASE("FileSystem", "[file-system]")
{
   CATCH_SECTION("basename")
   {
      CATCH_REQUIRE(basename("/usr/bin/formcheck-cli") == "formcheck-cli");
      CATCH_REQUIRE(basename("squat.mp4", true) == "squat");
      CATCH_REQUIRE(file_ext("/tmp/squat.mp4") == ".mp4");
      CATCH_REQUIRE(file_ext("/tmp/squat") == "");
   }

   CATCH_SECTION("put-get-contents")
   {
      const string fname = "/tmp/formcheck-file-contents.test";
      const string data  = "{\"frames\": []}\n\0binary"s;
      CATCH_REQUIRE(!file_put_contents(fname, data));
      CATCH_REQUIRE(is_regular_file(fname));
      CATCH_REQUIRE(!is_directory(fname));
      CATCH_REQUIRE(file_get_contents(fname) == data);
      CATCH_REQUIRE(!delete_file(fname));
      CATCH_REQUIRE(!is_regular_file(fname));
      CATCH_REQUIRE_THROWS(file_get_contents(fname));

      string out;
      CATCH_REQUIRE(file_get_contents(fname, out));
      CATCH_REQUIRE(is_directory("/tmp"));
   }
}

} // namespace formcheck
