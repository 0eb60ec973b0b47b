#pragma once

#include <string>
#include <vector>

#include "match.hpp"
#include "tournament.hpp"
#include "types.hpp"

// integer value of a command line keyword, throws configuration_error if value is not an int
int parse_int(const std::string &key, const std::string &value);

// creates the directory holding path if it is missing
void ensure_parent_directory(const std::string &path);

// writes the tournament report, a timestamped file name is used if filename is empty
std::string save_results(const payoff_model &config, const tournament_result &res, std::string filename = "");

match_result run_individual_match(const payoff_model &config, strategy_ptr a, strategy_ptr b, std::string log_file = "", bool verbose = false);

tournament_result run_tournament(const payoff_model &config, std::vector<strategy_ptr> roster, std::string log_file, std::string results_file, bool verbose = false);
