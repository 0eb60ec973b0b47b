#include "strategy.hpp"

#include <algorithm>

#include "random_source.hpp"

using namespace std;

bool valid_action(action a) {
  return a == COOPERATE || a == DEFECT;
}

action flip(action a) {
  return a == COOPERATE ? DEFECT : COOPERATE;
}

char action_symbol(action a) {
  return a == COOPERATE ? 'C' : 'D';
}

string history_string(const history &h) {
  string res(h.size(), ' ');
  for (int i = 0; i < h.size(); i++) res[i] = action_symbol(h[i]);
  return res;
}

int count_action(const history &h, action a, int n) {
  auto start = h.begin();
  if (n >= 0 && n < h.size()) start = h.end() - n;
  return count(start, h.end(), a);
}

strategy::strategy(string n) : name(n) {}

void strategy::reset() {}

stochastic_strategy::stochastic_strategy(string n, random_source_ptr r) : strategy(n), rng(r) {
  if (!rng) rng = default_random_source();
}

bool stochastic_strategy::chance(double p) {
  return rng->u01() < p;
}
