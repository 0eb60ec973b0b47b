#pragma once

#include <memory>
#include <string>

#include "types.hpp"

bool valid_action(action a);
action flip(action a);
char action_symbol(action a);
std::string history_string(const history &h);

// number of occurrences of a among the last n entries of h (n < 0: all of h)
int count_action(const history &h, action a, int n = -1);

// Decision policy for the repeated game. decide sees only the rounds played
// so far, its own moves first. reset is called before every match.
class strategy {
 public:
  std::string name;

  strategy(std::string name);
  virtual ~strategy() = default;

  virtual action decide(const history &own, const history &opponent) = 0;
  virtual void reset();
};

// Strategy drawing from a random source; defaults to the process-wide one.
class stochastic_strategy : public strategy {
 protected:
  random_source_ptr rng;

  // true with probability p
  bool chance(double p);

 public:
  stochastic_strategy(std::string name, random_source_ptr rng = nullptr);
};
