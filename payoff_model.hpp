#pragma once

#include <string>

#include "types.hpp"

// Payoffs and sizing for one run. Validated on construction, never modified.
class payoff_model {
 public:
  const int defect_win;
  const int mutual_cooperate;
  const int mutual_defect;
  const int cooperate_loss;
  const int rounds_per_match;
  const int matches_per_pair;

  payoff_model(int defect_win, int mutual_cooperate, int mutual_defect, int cooperate_loss, int rounds_per_match, int matches_per_pair);

  score_pair payoff(action a, action b) const;
  std::string str() const;
};
