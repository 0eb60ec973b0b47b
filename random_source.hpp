#pragma once

#include <random>

#include "types.hpp"
#include "utility.hpp"

// Uniform draws in [0, 1) for probabilistic strategies.
class random_source {
 public:
  virtual ~random_source() = default;
  virtual double u01() = 0;
};

// Mersenne twister shared between strategies, guarded by an omp lock.
class mt_random_source : public random_source {
  std::mt19937 gen;
  std::uniform_real_distribution<double> distribution;
  MutexType m;

 public:
  mt_random_source();
  mt_random_source(unsigned int s);

  double u01() override;
  void seed(unsigned int s);
};

// process-wide source used when a strategy is built without one
random_source_ptr default_random_source();
void seed_default_random_source(unsigned int s);
