#include <catch2/catch.hpp>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include "arena.hpp"
#include "basic_strategies.hpp"
#include "errors.hpp"
#include "payoff_model.hpp"
#include "test_helpers.hpp"

namespace {

int occurrences(const std::string &text, const std::string &what) {
  int n = 0;
  for (size_t pos = text.find(what); pos != std::string::npos; pos = text.find(what, pos + 1)) n++;
  return n;
}

}  // namespace

TEST_CASE("parse_int accepts exactly the int range", "[arena]") {
  REQUIRE(parse_int("rounds", "42") == 42);
  REQUIRE(parse_int("cooperate_loss", "-7") == -7);
  REQUIRE(parse_int("rounds", "2147483647") == 2147483647);
  REQUIRE(parse_int("cooperate_loss", "-2147483648") == -2147483647 - 1);

  REQUIRE_THROWS_AS(parse_int("rounds", "2147483648"), configuration_error);
  REQUIRE_THROWS_AS(parse_int("rounds", "99999999999"), configuration_error);
  REQUIRE_THROWS_AS(parse_int("cooperate_loss", "-2147483649"), configuration_error);
  REQUIRE_THROWS_AS(parse_int("rounds", "999999999999999999999999"), configuration_error);
  REQUIRE_THROWS_AS(parse_int("rounds", ""), configuration_error);
  REQUIRE_THROWS_AS(parse_int("rounds", "12x"), configuration_error);
}

TEST_CASE("parent directories are created on demand", "[arena]") {
  scratch_dir dir;
  REQUIRE_NOTHROW(ensure_parent_directory(dir.path("a/b/c/file.txt")));
  REQUIRE_NOTHROW(ensure_parent_directory(dir.path("a/b/c/file.txt")));
  REQUIRE_NOTHROW(ensure_parent_directory("no_directory.txt"));

  std::ofstream(dir.path("a/b/c/file.txt")) << "x";
  REQUIRE(read_file(dir.path("a/b/c/file.txt")) == "x");

  // a regular file in the way
  REQUIRE_THROWS_AS(ensure_parent_directory(dir.path("a/b/c/file.txt/d/log.txt")), std::runtime_error);
}

TEST_CASE("individual matches append their histories to the log", "[arena]") {
  scratch_dir dir;
  std::string log_file = dir.path("logs/nested/match.log");
  payoff_model pm(5, 3, 1, 0, 4, 2);

  match_result res = run_individual_match(pm, std::make_shared<tit_for_tat>(), std::make_shared<always_defect>(), log_file);
  REQUIRE(res.size() == 2);
  REQUIRE(res.scores_a[0] == 3);

  std::string log = read_file(log_file);
  REQUIRE(log.find("individual match TitForTat vs AlwaysDefect") != std::string::npos);
  REQUIRE(log.find("Arena: config: " + pm.str()) != std::string::npos);
  REQUIRE(log.find("Arena: match 1: A CDDD\n") != std::string::npos);
  REQUIRE(log.find("Arena: match 2: B DDDD\n") != std::string::npos);
  REQUIRE(log.find("Match: round") == std::string::npos);

  run_individual_match(pm, std::make_shared<tit_for_tat>(), std::make_shared<always_defect>(), log_file);
  log = read_file(log_file);
  REQUIRE(occurrences(log, "individual match TitForTat vs AlwaysDefect") == 2);
  REQUIRE(occurrences(log, "Arena: match 1: A CDDD\n") == 2);
}

TEST_CASE("verbose individual matches trace every round into the log", "[arena]") {
  scratch_dir dir;
  std::string log_file = dir.path("match.log");
  payoff_model pm(5, 3, 1, 0, 3, 1);

  run_individual_match(pm, std::make_shared<always_cooperate>(), std::make_shared<always_defect>(), log_file, true);

  std::string log = read_file(log_file);
  REQUIRE(log.find("Match: round 1: A=C, B=D, payoff: A=0, B=5") != std::string::npos);
  REQUIRE(log.find("Match: round 3: A=C, B=D, payoff: A=0, B=5") != std::string::npos);
}

TEST_CASE("tournaments log progress and save the ranking", "[arena]") {
  scratch_dir dir;
  std::string log_file = dir.path("logs/tournament.log");
  std::string results_file = dir.path("results/deep/tournament_results.txt");
  payoff_model pm(5, 3, 1, 0, 10, 3);
  std::vector<strategy_ptr> roster = {std::make_shared<always_cooperate>(), std::make_shared<always_defect>(), std::make_shared<tit_for_tat>()};

  tournament_result res = run_tournament(pm, roster, log_file, results_file);
  REQUIRE(res.ranking[0].name == "AlwaysDefect");

  std::string log = read_file(log_file);
  REQUIRE(log.find("Tournament: start") != std::string::npos);
  REQUIRE(log.find("Tournament: completed 3/3 (100.0%)") != std::string::npos);
  REQUIRE(log.find("Match: round") == std::string::npos);

  std::string results = read_file(results_file);
  REQUIRE(results.find("final ranking:\n1. AlwaysDefect: 32.00\n2. TitForTat: 19.50\n3. AlwaysCooperate: 15.00\n") != std::string::npos);

  roster = {std::make_shared<always_cooperate>(), std::make_shared<always_defect>()};
  run_tournament(pm, roster, log_file, results_file, true);
  log = read_file(log_file);
  REQUIRE(occurrences(log, "Tournament: start") == 2);
  REQUIRE(log.find("Match: round 1: A=C, B=D, payoff: A=0, B=5") != std::string::npos);
}
