#include "pattern_strategies.hpp"

#include <algorithm>

using namespace std;

bool matches_at(const history &h, int pos, const history &pattern) {
  if (pos < 0 || pos + pattern.size() > h.size()) return false;
  return equal(pattern.begin(), pattern.end(), h.begin() + pos);
}

pattern_detector::pattern_detector(string n) : strategy(n), pattern_length(3) {}

action pattern_detector::decide(const history &own, const history &opponent) {
  int n = opponent.size();
  if (n < pattern_length + 1) return COOPERATE;

  history recent(opponent.end() - pattern_length, opponent.end());

  // skip the tail so that the recent window never matches itself
  for (int i = 0; i < n - 2 * pattern_length; i++) {
    if (matches_at(opponent, i, recent) && opponent[i + pattern_length] == DEFECT) return DEFECT;
  }

  return COOPERATE;
}

pattern_matching_tit_for_tat::pattern_matching_tit_for_tat(string n) : strategy(n), pattern_length(4), min_occurrences(2) {}

action pattern_matching_tit_for_tat::decide(const history &own, const history &opponent) {
  if (opponent.empty()) return COOPERATE;

  if (opponent.size() >= 3 * pattern_length && count_occurrences(opponent) >= min_occurrences) {
    history pattern(opponent.end() - pattern_length, opponent.end());
    if (defect_probability(opponent, pattern) > 0.5) return DEFECT;
  }

  return opponent.back();
}

int pattern_matching_tit_for_tat::count_occurrences(const history &opponent) const {
  int n = opponent.size();
  if (n < 2 * pattern_length) return 0;

  history recent(opponent.end() - pattern_length, opponent.end());
  int occurrences = 0;
  for (int i = 0; i <= n - 2 * pattern_length; i++) {
    if (matches_at(opponent, i, recent)) occurrences++;
  }

  return occurrences;
}

double pattern_matching_tit_for_tat::defect_probability(const history &opponent, const history &pattern) const {
  int n = opponent.size();
  int len = pattern.size();
  int followers = 0;
  int defections = 0;

  for (int i = 0; i < n - len; i++) {
    if (!matches_at(opponent, i, pattern)) continue;
    followers++;
    if (opponent[i + len] == DEFECT) defections++;
  }

  if (followers == 0) return 0;
  return defections / (double)followers;
}

frequency_analysis::frequency_analysis(string n) : strategy(n) {
  reset();
}

action frequency_analysis::decide(const history &own, const history &opponent) {
  if (own.size() > 1 && opponent.size() > 1) {
    bool opponent_defected = opponent.back() == DEFECT;
    if (own[own.size() - 2] == COOPERATE) {
      after_coop_total++;
      after_coop_defect += opponent_defected;
    } else {
      after_defect_total++;
      after_defect_defect += opponent_defected;
    }
  }

  if (opponent.size() < 5) return COOPERATE;

  double coop_rate = after_cooperate_defect_rate();
  double defect_rate = after_defect_defect_rate();

  if (coop_rate > 0.6) {
    return DEFECT;
  } else if (defect_rate > coop_rate + 0.3) {
    return COOPERATE;
  } else if (coop_rate > 0.4 && defect_rate > 0.4) {
    return DEFECT;
  }

  return opponent.back();
}

void frequency_analysis::reset() {
  after_coop_defect = 0;
  after_coop_total = 0;
  after_defect_defect = 0;
  after_defect_total = 0;
}

double frequency_analysis::after_cooperate_defect_rate() const {
  return after_coop_defect / (double)max(1, after_coop_total);
}

double frequency_analysis::after_defect_defect_rate() const {
  return after_defect_defect / (double)max(1, after_defect_total);
}

const vector<history> rhythm_detector::rhythms = {
    {DEFECT},
    {COOPERATE},
    {DEFECT, COOPERATE},
    {COOPERATE, COOPERATE, DEFECT},
    {COOPERATE, DEFECT, DEFECT}};

rhythm_detector::rhythm_detector(string n, random_source_ptr r) : stochastic_strategy(n, r) {
  reset();
}

action rhythm_detector::decide(const history &own, const history &opponent) {
  if (opponent.size() < 6) return COOPERATE;

  if (detected_rhythm.empty()) {
    for (auto &r : rhythms) {
      double confidence = check_rhythm(opponent, r);
      if (confidence > 0.7 && confidence > rhythm_confidence) {
        detected_rhythm = r;
        rhythm_confidence = confidence;
      }
    }
  }

  if (detected_rhythm.empty()) return opponent.back();

  action predicted = detected_rhythm[opponent.size() % detected_rhythm.size()];
  if (predicted == DEFECT) return DEFECT;

  // a pure cooperator gets exploited now and then
  if (detected_rhythm.size() == 1 && chance(0.1)) return DEFECT;
  return COOPERATE;
}

void rhythm_detector::reset() {
  detected_rhythm.clear();
  rhythm_confidence = 0;
}

const history &rhythm_detector::rhythm() const {
  return detected_rhythm;
}

double rhythm_detector::check_rhythm(const history &h, const history &pattern) {
  if (h.empty() || pattern.empty()) return 0;

  int matches = 0;
  for (int i = 0; i < h.size(); i++) {
    if (h[i] == pattern[i % pattern.size()]) matches++;
  }

  return matches / (double)h.size();
}
