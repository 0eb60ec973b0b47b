#include "probing_strategies.hpp"

#include <algorithm>

#include "random_source.hpp"

using namespace std;

escape_tiger::escape_tiger(string n) : strategy(n) {
  reset();
}

action escape_tiger::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  if (!own.empty() && own.back() == COOPERATE && opponent.back() == COOPERATE) {
    coop_streak++;
  } else {
    coop_streak = 0;
  }

  // read the reaction to last round's probe
  if (test_mode) {
    test_mode = false;
    exploit_mode = opponent.back() == COOPERATE;
    return exploit_mode ? DEFECT : COOPERATE;
  }

  if (exploit_mode) {
    if (opponent.back() == DEFECT) {
      exploit_mode = false;
      return COOPERATE;
    }
    return DEFECT;
  }

  if (coop_streak >= 5) {
    test_mode = true;
    coop_streak = 0;
    return DEFECT;
  }

  return COOPERATE;
}

void escape_tiger::reset() {
  coop_streak = 0;
  test_mode = false;
  exploit_mode = false;
}

inching::inching(string n, random_source_ptr r) : stochastic_strategy(n, r), defect_rate(0) {}

action inching::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  if (opponent.back() == COOPERATE) {
    defect_rate = min(0.7, defect_rate + 0.05);
  } else {
    defect_rate = max(0.0, defect_rate - 0.2);
  }

  return chance(defect_rate) ? DEFECT : COOPERATE;
}

void inching::reset() {
  defect_rate = 0;
}

trust_building::trust_building(string n, random_source_ptr r) : stochastic_strategy(n, r), trust_level(1), forgiveness(0.1) {}

action trust_building::decide(const history &own, const history &opponent) {
  if (opponent.size() < 3) return COOPERATE;

  if (opponent.back() == DEFECT) {
    trust_level = max(0.0, trust_level - 0.3);
  } else {
    trust_level = min(1.0, trust_level + forgiveness);
  }

  return chance(trust_level) ? COOPERATE : DEFECT;
}

void trust_building::reset() {
  trust_level = 1;
}

consensus::consensus(string n, random_source_ptr r) : stochastic_strategy(n, r) {}

action consensus::decide(const history &own, const history &opponent) {
  if (own.empty() || opponent.empty()) return COOPERATE;
  if (own.back() == opponent.back()) return COOPERATE;
  return chance(2 / 7.0) ? COOPERATE : DEFECT;
}

probe::probe(string n, random_source_ptr r) : stochastic_strategy(n, r) {
  reset();
}

action probe::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  rounds++;
  if (cooperation_prob > 0.5) cooperation_prob = max(0.5, 1 - 0.01 * rounds);

  action tft = opponent.back();
  if (tft == COOPERATE && rng->u01() > cooperation_prob) return DEFECT;
  return tft;
}

void probe::reset() {
  cooperation_prob = 1;
  rounds = 0;
}

capped::capped(string n, random_source_ptr r) : stochastic_strategy(n, r) {}

action capped::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;
  if (opponent.back() == DEFECT) return DEFECT;
  return chance(0.9) ? COOPERATE : DEFECT;
}
