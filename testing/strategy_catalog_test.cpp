#include <catch2/catch.hpp>

#include <set>
#include <string>

#include "errors.hpp"
#include "strategy.hpp"
#include "strategy_catalog.hpp"
#include "test_helpers.hpp"

TEST_CASE("catalog lists thirty distinct strategies", "[catalog]") {
  auto names = catalog_names();
  REQUIRE(names.size() == 30);
  REQUIRE(std::set<std::string>(names.begin(), names.end()).size() == 30);
  REQUIRE(names.front() == "TitForTat");
}

TEST_CASE("catalog builds every strategy by name", "[catalog]") {
  auto rng = script({0.3, 0.8});
  for (auto name : catalog_names()) {
    strategy_ptr s = make_strategy(name, rng);
    REQUIRE(s);
    REQUIRE(s->name == name);

    // every policy is total over short histories
    REQUIRE(valid_action(s->decide({}, {})));
    REQUIRE(valid_action(s->decide(H("CD"), H("DD"))));
    s->reset();
  }
}

TEST_CASE("reset returns every strategy to its starting state", "[catalog]") {
  std::vector<double> draws = {0.3, 0.8, 0.55, 0.1, 0.95, 0.45, 0.7};
  std::vector<history> warmups = {H(std::string(23, 'C')), H("CCDCDDCCCCCDDDCCCCCCCDCCDC"), H(std::string(12, 'D'))};
  history opponent = H("CCCCCCCDCCDDCCCCCCCCCCCDCDDCCCC");

  for (auto name : catalog_names()) {
    for (auto &warmup : warmups) {
      INFO(name << " after " << history_string(warmup));
      auto used_rng = script(draws);
      auto fresh_rng = script(draws);
      strategy_ptr used = make_strategy(name, used_rng);
      strategy_ptr fresh = make_strategy(name, fresh_rng);

      replay(*used, warmup);
      used->reset();
      used_rng->rewind();

      REQUIRE(history_string(replay(*used, opponent)) == history_string(replay(*fresh, opponent)));
    }
  }
}

TEST_CASE("catalog rejects unknown names", "[catalog]") {
  REQUIRE_THROWS_AS(make_strategy("Nope"), configuration_error);
}

TEST_CASE("all_strategies returns fresh instances in catalog order", "[catalog]") {
  auto a = all_strategies();
  auto b = all_strategies();
  auto names = catalog_names();
  REQUIRE(a.size() == names.size());
  for (int i = 0; i < a.size(); i++) {
    REQUIRE(a[i]->name == names[i]);
    REQUIRE(a[i] != b[i]);
  }
}
