#include "adaptive_strategies.hpp"

#include <algorithm>

using namespace std;

adaptive_agent::adaptive_agent(string n) : strategy(n), cooperation_rate(0) {}

action adaptive_agent::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  cooperation_rate = count_action(opponent, COOPERATE) / (double)opponent.size();

  if (cooperation_rate >= 0.7) {
    return COOPERATE;
  } else if (cooperation_rate <= 0.3) {
    return DEFECT;
  }

  return opponent.back();
}

void adaptive_agent::reset() {
  cooperation_rate = 0;
}

double adaptive_agent::opponent_cooperation_rate() const {
  return cooperation_rate;
}

hybrid::hybrid(string n, reference_payoffs p) : strategy(n), payoffs(p) {
  reset();
}

action hybrid::decide(const history &own, const history &opponent) {
  rounds++;

  if (rounds - last_switch >= evaluation_period) {
    evaluate_strategies(own, opponent);
    last_switch = rounds;
  }

  return play(current_strategy, own, opponent);
}

void hybrid::reset() {
  current_strategy = TIT_FOR_TAT;
  strategy_performance.assign(NUM_CANDIDATES, 0);
  rounds = 0;
  last_switch = 0;
}

hybrid::candidate hybrid::current() const {
  return current_strategy;
}

const vector<int> &hybrid::performance() const {
  return strategy_performance;
}

action hybrid::play(candidate c, const history &own, const history &opponent) {
  switch (c) {
    case ALWAYS_DEFECT:
      return DEFECT;
    case ALWAYS_COOPERATE:
      return COOPERATE;
    default:
      return opponent.empty() ? COOPERATE : opponent.back();
  }
}

int hybrid::score(action own, action opponent) const {
  if (own == COOPERATE && opponent == COOPERATE) return payoffs.mutual_cooperate;
  if (own == DEFECT && opponent == COOPERATE) return payoffs.defect_win;
  if (own == COOPERATE && opponent == DEFECT) return payoffs.cooperate_loss;
  return payoffs.mutual_defect;
}

void hybrid::evaluate_strategies(const history &own, const history &opponent) {
  const int window = evaluation_period;
  if (opponent.size() < window || own.size() < window) return;

  history recent_own(own.end() - window, own.end());
  history recent_opponent(opponent.end() - window, opponent.end());

  for (int c = 0; c < NUM_CANDIDATES; c++) {
    int total = 0;

    for (int i = 0; i < window; i++) {
      action a;
      if (i == 0 && opponent.size() <= window) {
        a = COOPERATE;
      } else {
        // the replay starts without any history in front of the window
        history prev_own(recent_own.begin(), recent_own.begin() + i);
        history prev_opponent(recent_opponent.begin(), recent_opponent.begin() + i);
        a = play((candidate)c, prev_own, prev_opponent);
      }
      total += score(a, recent_opponent[i]);
    }

    strategy_performance[c] = total;
  }

  current_strategy = (candidate)(max_element(strategy_performance.begin(), strategy_performance.end()) - strategy_performance.begin());
}
