#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>

#include "utility.hpp"

TEST_CASE("quantile picks the lower nearest rank", "[utility]") {
  vec x = {4, 1, 3, 2};
  REQUIRE(quantile(x, 0) == 1);
  REQUIRE(quantile(x, 0.25) == 2);
  REQUIRE(quantile(x, 0.5) == 3);
  REQUIRE(quantile(x, 1) == 4);
  REQUIRE(quantile({7}, 0.25) == 7);
  REQUIRE(quantile({5, 1, 9}, 0.25) == 1);
  REQUIRE_THROWS_AS(quantile({}, 0.25), std::invalid_argument);
}

TEST_CASE("sample statistics", "[utility]") {
  REQUIRE(mean({}) == 0);
  REQUIRE(mean({1, 2, 3}) == Approx(2));
  REQUIRE(sum({1.5, 2.5}) == Approx(4));
  REQUIRE(min({3, -1, 2}) == -1);
  REQUIRE(max({3, -1, 2}) == 3);
}

TEST_CASE("string helpers", "[utility]") {
  REQUIRE(join_string({"a", "b", "c"}, ", ") == "a, b, c");
  REQUIRE(join_string({}, ", ") == "");
  REQUIRE(format_fixed(3.14159) == "3.14");
  REQUIRE(format_fixed(2.5, 1) == "2.5");
  REQUIRE(timestamp("%Y").size() == 4);

  std::stringstream ss;
  ss << std::vector<int>({1, 2});
  REQUIRE(ss.str() == "[1, 2]");
}
