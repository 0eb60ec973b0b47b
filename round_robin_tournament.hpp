#pragma once

#include <iostream>

#include "tournament.hpp"

// Every strategy meets every other one once (matches_per_pair matches).
// A side's score against an opponent is the first quartile of its match
// totals; its tournament score is the mean of those over all opponents.
class round_robin_tournament : public tournament {
 public:
  std::ostream *enable_output;
  std::ostream *trace_output;

  round_robin_tournament(std::ostream *output = nullptr, std::ostream *trace = nullptr);
  tournament_result run(const payoff_model &config, std::vector<strategy_ptr> &roster) override;
};
