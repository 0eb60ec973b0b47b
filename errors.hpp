#pragma once

#include <stdexcept>
#include <string>

// malformed payoff ordering, non-positive counts, bad command line values
struct configuration_error : public std::runtime_error {
  explicit configuration_error(const std::string &what) : std::runtime_error(what) {}
};

// a strategy returned something other than COOPERATE or DEFECT
struct protocol_violation : public std::runtime_error {
  explicit protocol_violation(const std::string &what) : std::runtime_error(what) {}
};

struct roster_error : public std::runtime_error {
  explicit roster_error(const std::string &what) : std::runtime_error(what) {}
};
