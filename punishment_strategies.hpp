#pragma once

#include <string>

#include "strategy.hpp"

// Retaliates for every exploited cooperation with as many defections as
// the opponent has exploited it so far.
class gradual : public strategy {
  int revenge_counter;
  int defect_count;

 public:
  gradual(std::string name = "Gradual");
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

class punishment_escalation : public strategy {
  int defect_count;
  int punishment_streak;

 public:
  punishment_escalation(std::string name = "PunishmentEscalation");
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

// Punishment length picked from the opponent's running defection rate.
class adaptive_punishment : public strategy {
  int punishment_level;
  int defect_count;
  int rounds;
  int punishment_streak;

 public:
  adaptive_punishment(std::string name = "AdaptivePunishment");
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

// Two rounds of revenge, then probabilistic cooperation that becomes more
// likely the longer the opponent stays clean.
class gradual_forgiving : public stochastic_strategy {
  int revenge_counter;
  int forgiveness;
  int rounds_since_defect;

 public:
  gradual_forgiving(std::string name = "GradualForgiving", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

class reward_punishment : public strategy {
  int punishment_counter;

 public:
  static const int max_punishment = 5;

  reward_punishment(std::string name = "RewardPunishment");
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};
