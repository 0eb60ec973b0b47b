#include <catch2/catch.hpp>

#include "basic_strategies.hpp"
#include "test_helpers.hpp"

TEST_CASE("constant strategies ignore the opponent", "[basic]") {
  always_cooperate ac;
  always_defect ad;
  REQUIRE(ac.name == "AlwaysCooperate");
  REQUIRE(ad.name == "AlwaysDefect");
  REQUIRE(history_string(replay(ac, H("DDDD"))) == "CCCC");
  REQUIRE(history_string(replay(ad, H("CCCC"))) == "DDDD");
}

TEST_CASE("random strategy splits draws at one half", "[basic]") {
  auto rng = script({0.2, 0.7, 0.49, 0.5});
  random_strategy r("Random", rng);
  REQUIRE(history_string(replay(r, H("CCCC"))) == "CDCD");
  REQUIRE(rng->calls() == 4);
}

TEST_CASE("tit for tat opens with cooperation and mirrors", "[basic]") {
  tit_for_tat t;
  REQUIRE(t.decide({}, {}) == COOPERATE);
  REQUIRE(history_string(replay(t, H("CDDC"))) == "CCDD");
}

TEST_CASE("forgiving tit for tat needs two defections in three rounds", "[basic]") {
  forgiving_tit_for_tat t;
  REQUIRE(history_string(replay(t, H("CCDDDC"))) == "CCCCDD");
  REQUIRE(t.decide(H("CCC"), H("DD")) == COOPERATE);
  REQUIRE(t.decide(H("CCCC"), H("DCDC")) == COOPERATE);
  REQUIRE(t.decide(H("CCCC"), H("CDCD")) == DEFECT);
}

TEST_CASE("grudge never forgives until reset", "[basic]") {
  grudge g;
  REQUIRE(history_string(replay(g, H("CCDCCC"))) == "CCCDDD");

  g.reset();
  REQUIRE(g.decide({}, {}) == COOPERATE);
  REQUIRE(g.decide(H("C"), H("C")) == COOPERATE);
}

TEST_CASE("win stay lose shift keys on the opponent's last move", "[basic]") {
  win_stay_lose_shift w;
  REQUIRE(w.decide({}, {}) == COOPERATE);
  REQUIRE(w.decide(H("C"), H("C")) == COOPERATE);
  REQUIRE(w.decide(H("D"), H("C")) == DEFECT);
  REQUIRE(w.decide(H("C"), H("D")) == DEFECT);
  REQUIRE(w.decide(H("D"), H("D")) == COOPERATE);
}

TEST_CASE("pavlov follows its outcome table", "[basic]") {
  pavlov p;
  REQUIRE(p.decide({}, {}) == COOPERATE);
  REQUIRE(p.decide(H("C"), H("C")) == COOPERATE);
  REQUIRE(p.decide(H("D"), H("C")) == DEFECT);
  REQUIRE(p.decide(H("C"), H("D")) == DEFECT);
  REQUIRE(p.decide(H("D"), H("D")) == COOPERATE);
}

TEST_CASE("two coop one defect cycles regardless of the opponent", "[basic]") {
  two_coop_one_defect t;
  REQUIRE(history_string(replay(t, H("DDDDDDD"))) == "CCDCCDC");

  t.reset();
  REQUIRE(history_string(replay(t, H("CCC"))) == "CCD");
}
