#include "punishment_strategies.hpp"

#include <algorithm>

using namespace std;

gradual::gradual(string n) : strategy(n) {
  reset();
}

action gradual::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  if (opponent.back() == DEFECT && !own.empty() && own.back() == COOPERATE) {
    defect_count++;
    revenge_counter = defect_count;
  }

  if (revenge_counter > 0) {
    revenge_counter--;
    return DEFECT;
  }

  return COOPERATE;
}

void gradual::reset() {
  revenge_counter = 0;
  defect_count = 0;
}

punishment_escalation::punishment_escalation(string n) : strategy(n) {
  reset();
}

action punishment_escalation::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  if (punishment_streak > 0) {
    punishment_streak--;
    return DEFECT;
  }

  if (opponent.back() == DEFECT) {
    defect_count++;
    punishment_streak = min(5, defect_count / 2);
    return DEFECT;
  }

  return COOPERATE;
}

void punishment_escalation::reset() {
  defect_count = 0;
  punishment_streak = 0;
}

adaptive_punishment::adaptive_punishment(string n) : strategy(n) {
  reset();
}

action adaptive_punishment::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  rounds++;

  if (punishment_streak > 0) {
    punishment_streak--;
    return DEFECT;
  }

  if (opponent.back() == DEFECT) {
    defect_count++;

    double defect_rate = defect_count / (double)rounds;
    if (defect_rate > 0.5) {
      punishment_level = 3;
    } else if (defect_rate > 0.3) {
      punishment_level = 2;
    } else {
      punishment_level = 1;
    }

    punishment_streak = punishment_level;
    return DEFECT;
  }

  return COOPERATE;
}

void adaptive_punishment::reset() {
  punishment_level = 1;
  defect_count = 0;
  rounds = 0;
  punishment_streak = 0;
}

gradual_forgiving::gradual_forgiving(string n, random_source_ptr r) : stochastic_strategy(n, r) {
  reset();
}

action gradual_forgiving::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  if (opponent.back() == DEFECT) {
    rounds_since_defect = 0;
  } else {
    rounds_since_defect++;
  }

  if (opponent.back() == DEFECT && !own.empty() && own.back() == COOPERATE) {
    revenge_counter = 2;
    forgiveness = 5;
  }

  if (revenge_counter > 0) {
    revenge_counter--;
    return DEFECT;
  }

  if (rounds_since_defect >= forgiveness) {
    forgiveness = 0;
    return COOPERATE;
  }

  double coop_prob = min(0.9, 0.5 + rounds_since_defect * 0.1);
  return chance(coop_prob) ? COOPERATE : DEFECT;
}

void gradual_forgiving::reset() {
  revenge_counter = 0;
  forgiveness = 0;
  rounds_since_defect = 0;
}

reward_punishment::reward_punishment(string n) : strategy(n), punishment_counter(0) {}

action reward_punishment::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  if (opponent.back() == COOPERATE) {
    punishment_counter = max(0, punishment_counter - 1);
    return COOPERATE;
  }

  punishment_counter = min((int)max_punishment, punishment_counter + 2);
  return punishment_counter > 0 ? DEFECT : COOPERATE;
}

void reward_punishment::reset() {
  punishment_counter = 0;
}
