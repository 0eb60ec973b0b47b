#pragma once

#include <string>
#include <vector>

#include "types.hpp"

// Registry of every built-in strategy, in default roster order.
std::vector<std::string> catalog_names();

// builds the strategy registered under name, throws configuration_error if unknown
strategy_ptr make_strategy(const std::string &name, random_source_ptr rng = nullptr);

// one fresh instance of every registered strategy
std::vector<strategy_ptr> all_strategies(random_source_ptr rng = nullptr);
