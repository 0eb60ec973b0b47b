#include "memory_strategies.hpp"

#include <algorithm>

using namespace std;

memory_strategy::memory_strategy(string n, int w, int wu, double lo, double hi, random_source_ptr r)
    : stochastic_strategy(n, r), window(w), warmup(wu), low(lo), high(hi), initial_prob(0.7) {
  reset();
}

action memory_strategy::decide(const history &own, const history &opponent) {
  int n = opponent.size();

  if (n >= warmup && n > 0) {
    int lookback = window > 0 ? min(window, n) : n;
    double fraction = count_action(opponent, COOPERATE, lookback) / (double)lookback;
    coop_prob = low + fraction * (high - low);
  }

  return chance(coop_prob) ? COOPERATE : DEFECT;
}

void memory_strategy::reset() {
  coop_prob = initial_prob;
}

double memory_strategy::cooperation_probability() const {
  return coop_prob;
}

short_memory::short_memory(string n, random_source_ptr r) : memory_strategy(n, 3, 3, 0.3, 0.7, r) {}

medium_memory::medium_memory(string n, random_source_ptr r) : memory_strategy(n, 15, 1, 0.2, 0.8, r) {}

long_memory::long_memory(string n, random_source_ptr r) : memory_strategy(n, 0, 1, 0.2, 0.8, r) {}

tit_for_tat_start_medium_memory::tit_for_tat_start_medium_memory(string n, random_source_ptr r) : medium_memory(n, r) {}

action tit_for_tat_start_medium_memory::decide(const history &own, const history &opponent) {
  if (opponent.size() < 5) return opponent.empty() ? COOPERATE : opponent.back();
  return medium_memory::decide(own, opponent);
}
