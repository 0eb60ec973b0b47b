#pragma once

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

struct win_count {
  int wins_a;
  int wins_b;
  int draws;
};

// Totals and move histories of every match played between one ordered pair.
struct match_result {
  std::vector<int> scores_a;
  std::vector<int> scores_b;
  std::vector<history> histories_a;
  std::vector<history> histories_b;

  void add_match(int score_a, int score_b, const history &history_a, const history &history_b);
  int size() const;

  std::pair<double, double> average_scores() const;
  std::pair<int, int> min_scores() const;
  std::pair<double, double> median_scores() const;
  std::pair<double, double> quartile_scores() const;
  win_count wins() const;
  std::string win_count_info() const;
  std::string summary() const;
};

class match {
 public:
  const payoff_model &config;
  std::ostream *enable_output;

  match(const payoff_model &config, std::ostream *output = nullptr);
  match_result run(strategy_ptr a, strategy_ptr b);

 private:
  void play_single(strategy &a, strategy &b, int &total_a, int &total_b, history &history_a, history &history_b);
};
