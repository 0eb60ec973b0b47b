#include "basic_strategies.hpp"

#include <algorithm>

using namespace std;

always_cooperate::always_cooperate(string n) : strategy(n) {}

action always_cooperate::decide(const history &own, const history &opponent) {
  return COOPERATE;
}

always_defect::always_defect(string n) : strategy(n) {}

action always_defect::decide(const history &own, const history &opponent) {
  return DEFECT;
}

random_strategy::random_strategy(string n, random_source_ptr r) : stochastic_strategy(n, r) {}

action random_strategy::decide(const history &own, const history &opponent) {
  return chance(0.5) ? COOPERATE : DEFECT;
}

tit_for_tat::tit_for_tat(string n) : strategy(n) {}

action tit_for_tat::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;
  return opponent.back();
}

forgiving_tit_for_tat::forgiving_tit_for_tat(string n) : strategy(n) {}

action forgiving_tit_for_tat::decide(const history &own, const history &opponent) {
  if (opponent.size() < 3) return COOPERATE;
  return count_action(opponent, DEFECT, 3) >= 2 ? DEFECT : COOPERATE;
}

grudge::grudge(string n) : strategy(n), triggered(false) {}

action grudge::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;
  if (find(opponent.begin(), opponent.end(), DEFECT) != opponent.end()) triggered = true;
  return triggered ? DEFECT : COOPERATE;
}

void grudge::reset() {
  triggered = false;
}

win_stay_lose_shift::win_stay_lose_shift(string n) : strategy(n) {}

action win_stay_lose_shift::decide(const history &own, const history &opponent) {
  if (own.empty() || opponent.empty()) return COOPERATE;
  if (opponent.back() == COOPERATE) return own.back();
  return flip(own.back());
}

pavlov::pavlov(string n) : strategy(n) {}

action pavlov::decide(const history &own, const history &opponent) {
  if (own.empty() || opponent.empty()) return COOPERATE;

  // indexed by [own last][opponent last]
  static const action table[2][2] = {
      {COOPERATE, DEFECT},  // own C: (C,C) stays, (C,D) shifts
      {DEFECT, COOPERATE}   // own D: (D,C) stays, (D,D) shifts
  };
  return table[own.back()][opponent.back()];
}

two_coop_one_defect::two_coop_one_defect(string n) : strategy(n), counter(0) {}

action two_coop_one_defect::decide(const history &own, const history &opponent) {
  action a = counter == 2 ? DEFECT : COOPERATE;
  counter = (counter + 1) % 3;
  return a;
}

void two_coop_one_defect::reset() {
  counter = 0;
}
