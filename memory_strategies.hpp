#pragma once

#include <string>

#include "strategy.hpp"

// Cooperates with a probability rescaled from the opponent's cooperation
// fraction over a window into [low, high]. window == 0 uses the whole
// history. Below warmup rounds of history the initial probability is used.
class memory_strategy : public stochastic_strategy {
 protected:
  double coop_prob;

 public:
  const int window;
  const int warmup;
  const double low;
  const double high;
  const double initial_prob;

  memory_strategy(std::string name, int window, int warmup, double low, double high, random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
  void reset() override;

  double cooperation_probability() const;
};

class short_memory : public memory_strategy {
 public:
  short_memory(std::string name = "ShortMemory", random_source_ptr rng = nullptr);
};

class medium_memory : public memory_strategy {
 public:
  medium_memory(std::string name = "MediumMemory", random_source_ptr rng = nullptr);
};

class long_memory : public memory_strategy {
 public:
  long_memory(std::string name = "LongMemory", random_source_ptr rng = nullptr);
};

// tit for tat for the first five rounds, then medium memory
class tit_for_tat_start_medium_memory : public medium_memory {
 public:
  tit_for_tat_start_medium_memory(std::string name = "TitForTatStartMediumMemory", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
};
