#pragma once

#include <string>

#include "strategy.hpp"

// After five rounds of mutual cooperation defects once to probe the
// opponent. An unpunished probe switches to exploiting until the opponent
// retaliates; a punished one goes back to cooperation.
class escape_tiger : public strategy {
  int coop_streak;
  bool test_mode;
  bool exploit_mode;

 public:
  escape_tiger(std::string name = "EscapeTiger");
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

// Defection probability creeps up while the opponent cooperates and drops
// sharply when it defects.
class inching : public stochastic_strategy {
  double defect_rate;

 public:
  inching(std::string name = "Inching", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

class trust_building : public stochastic_strategy {
  double trust_level;
  double forgiveness;

 public:
  trust_building(std::string name = "TrustBuilding", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

// cooperates after matching moves, otherwise with probability 2/7
class consensus : public stochastic_strategy {
 public:
  consensus(std::string name = "Consensus", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
};

// Tit for tat whose cooperation probability decays towards one half.
class probe : public stochastic_strategy {
  double cooperation_prob;
  int rounds;

 public:
  probe(std::string name = "Probe", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

class capped : public stochastic_strategy {
 public:
  capped(std::string name = "Capped", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
};
