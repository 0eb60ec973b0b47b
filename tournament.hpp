#pragma once

#include <string>
#include <vector>

#include "match.hpp"
#include "types.hpp"

struct ranking_entry {
  std::string name;
  double score;
};

struct pair_record {
  std::string name_a;
  std::string name_b;
  double quartile_a;
  double quartile_b;
  match_result result;
};

struct tournament_result {
  std::vector<ranking_entry> ranking;
  std::vector<pair_record> pairs;
  hm<std::string, double> scores;
  double elapsed_seconds;
};

class tournament {
 public:
  virtual ~tournament() = default;
  virtual tournament_result run(const payoff_model &config, std::vector<strategy_ptr> &roster) = 0;
};

// renames repeated names to name_1, name_2, ... and returns the final names
std::vector<std::string> deduplicate_names(std::vector<strategy_ptr> &roster);

// plain text report of the parameters and the final ranking
std::string export_results(const payoff_model &config, const tournament_result &result);
