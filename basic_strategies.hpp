#pragma once

#include <string>

#include "strategy.hpp"

class always_cooperate : public strategy {
 public:
  always_cooperate(std::string name = "AlwaysCooperate");
  action decide(const history &own, const history &opponent) override;
};

class always_defect : public strategy {
 public:
  always_defect(std::string name = "AlwaysDefect");
  action decide(const history &own, const history &opponent) override;
};

class random_strategy : public stochastic_strategy {
 public:
  random_strategy(std::string name = "Random", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
};

class tit_for_tat : public strategy {
 public:
  tit_for_tat(std::string name = "TitForTat");
  action decide(const history &own, const history &opponent) override;
};

// defects only if the opponent defected in at least two of the last three rounds
class forgiving_tit_for_tat : public strategy {
 public:
  forgiving_tit_for_tat(std::string name = "ForgivingTitForTat");
  action decide(const history &own, const history &opponent) override;
};

class grudge : public strategy {
  bool triggered;

 public:
  grudge(std::string name = "Grudge");
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};

// keeps its move when the opponent cooperated, switches otherwise
class win_stay_lose_shift : public strategy {
 public:
  win_stay_lose_shift(std::string name = "WinStayLoseShift");
  action decide(const history &own, const history &opponent) override;
};

class pavlov : public strategy {
 public:
  pavlov(std::string name = "Pavlov");
  action decide(const history &own, const history &opponent) override;
};

// C, C, D, C, C, D, ...
class two_coop_one_defect : public strategy {
  int counter;

 public:
  two_coop_one_defect(std::string name = "TwoCoopOneDefect");
  action decide(const history &own, const history &opponent) override;
  void reset() override;
};
