#include <catch2/catch.hpp>

#include <string>

#include "memory_strategies.hpp"
#include "test_helpers.hpp"

TEST_CASE("short memory starts at 0.7 and rescales the last three rounds", "[memory]") {
  auto rng = script({0.69});
  short_memory s("ShortMemory", rng);
  REQUIRE(s.decide({}, {}) == COOPERATE);
  REQUIRE(s.decide(H("C"), H("D")) == COOPERATE);
  REQUIRE(s.cooperation_probability() == Approx(0.7));

  REQUIRE(s.decide(H("CCC"), H("DDD")) == DEFECT);
  REQUIRE(s.cooperation_probability() == Approx(0.3));

  s.decide(H("CCCC"), H("DDCC"));
  REQUIRE(s.cooperation_probability() == Approx(0.3 + 0.4 * 2 / 3.0));

  s.reset();
  REQUIRE(s.cooperation_probability() == Approx(0.7));
}

TEST_CASE("medium memory looks back at most fifteen rounds", "[memory]") {
  auto rng = script({0.0});
  medium_memory m("MediumMemory", rng);
  history opp = H("DDDDD" + std::string(15, 'C'));
  m.decide(history(opp.size(), COOPERATE), opp);
  REQUIRE(m.cooperation_probability() == Approx(0.8));

  m.decide(H("CCCC"), H("CCDD"));
  REQUIRE(m.cooperation_probability() == Approx(0.5));
}

TEST_CASE("long memory uses the whole history", "[memory]") {
  auto rng = script({0.0});
  long_memory l("LongMemory", rng);
  history opp = H("DDDDD" + std::string(15, 'C'));
  l.decide(history(opp.size(), COOPERATE), opp);
  REQUIRE(l.cooperation_probability() == Approx(0.65));
}

TEST_CASE("memory strategies share the band layout of the catalog", "[memory]") {
  short_memory s;
  medium_memory m;
  long_memory l;
  REQUIRE(s.low == Approx(0.3));
  REQUIRE(s.high == Approx(0.7));
  REQUIRE(m.low == Approx(0.2));
  REQUIRE(m.high == Approx(0.8));
  REQUIRE(l.window == 0);
  REQUIRE(m.window == 15);
  REQUIRE(s.window == 3);
}

TEST_CASE("tit for tat start medium memory switches after five rounds", "[memory]") {
  auto rng = script({0.99});
  tit_for_tat_start_medium_memory t("TitForTatStartMediumMemory", rng);
  REQUIRE(history_string(replay(t, H("CDCDC"))) == "CCDCD");
  REQUIRE(rng->calls() == 0);

  // all cooperation gives 0.8, a 0.99 draw defects
  REQUIRE(t.decide(H("CCCCC"), H("CCCCC")) == DEFECT);
  REQUIRE(rng->calls() == 1);
}
