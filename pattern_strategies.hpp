#pragma once

#include <string>
#include <vector>

#include "strategy.hpp"

// true if h[pos .. pos + pattern.size()) equals pattern
bool matches_at(const history &h, int pos, const history &pattern);

// Looks up the opponent's last three moves earlier in its history and
// defects pre-emptively if any earlier occurrence was followed by a defection.
class pattern_detector : public strategy {
 public:
  const int pattern_length;

  pattern_detector(std::string name = "PatternDetector");
  action decide(const history &own, const history &opponent) override;
};

class pattern_matching_tit_for_tat : public strategy {
 public:
  const int pattern_length;
  const int min_occurrences;

  pattern_matching_tit_for_tat(std::string name = "PatternMatchingTitForTat");
  action decide(const history &own, const history &opponent) override;

  // number of earlier occurrences of the opponent's last pattern_length moves
  int count_occurrences(const history &opponent) const;
  // share of defections following occurrences of the pattern
  double defect_probability(const history &opponent, const history &pattern) const;
};

// Opponent defection rates conditioned on our own move the round before.
class frequency_analysis : public strategy {
  int after_coop_defect;
  int after_coop_total;
  int after_defect_defect;
  int after_defect_total;

 public:
  frequency_analysis(std::string name = "FrequencyAnalysis");
  action decide(const history &own, const history &opponent) override;
  void reset() override;

  double after_cooperate_defect_rate() const;
  double after_defect_defect_rate() const;
};

// Fits the opponent history against a library of short periodic rhythms.
class rhythm_detector : public stochastic_strategy {
  history detected_rhythm;
  double rhythm_confidence;

 public:
  static const std::vector<history> rhythms;

  rhythm_detector(std::string name = "RhythmDetector", random_source_ptr rng = nullptr);
  action decide(const history &own, const history &opponent) override;
  void reset() override;

  const history &rhythm() const;
  static double check_rhythm(const history &h, const history &pattern);
};
