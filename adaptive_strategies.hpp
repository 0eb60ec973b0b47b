#pragma once

#include <string>
#include <vector>

#include "strategy.hpp"

class adaptive_agent : public strategy {
  double cooperation_rate;

 public:
  adaptive_agent(std::string name = "AdaptiveAgent");
  action decide(const history &own, const history &opponent) override;
  void reset() override;

  double opponent_cooperation_rate() const;
};

// Every ten rounds replays the last ten opponent moves against tit for tat,
// always defect and always cooperate, and continues with the best scorer.
class hybrid : public strategy {
 public:
  enum candidate {
    TIT_FOR_TAT = 0,
    ALWAYS_DEFECT,
    ALWAYS_COOPERATE,
    NUM_CANDIDATES
  };

  // reference payoffs used only for the replay
  struct reference_payoffs {
    int defect_win;
    int mutual_cooperate;
    int mutual_defect;
    int cooperate_loss;
  };

  static const int evaluation_period = 10;

  hybrid(std::string name = "Hybrid", reference_payoffs payoffs = {5, 3, 1, -2});
  action decide(const history &own, const history &opponent) override;
  void reset() override;

  candidate current() const;
  const std::vector<int> &performance() const;

 private:
  reference_payoffs payoffs;
  candidate current_strategy;
  std::vector<int> strategy_performance;
  int rounds;
  int last_switch;

  static action play(candidate c, const history &own, const history &opponent);
  int score(action own, action opponent) const;
  void evaluate_strategies(const history &own, const history &opponent);
};
