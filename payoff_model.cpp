#include "payoff_model.hpp"

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <sstream>

#include "errors.hpp"

using namespace std;

payoff_model::payoff_model(int dw, int mc, int md, int cl, int rpm, int mpp)
    : defect_win(dw), mutual_cooperate(mc), mutual_defect(md), cooperate_loss(cl), rounds_per_match(rpm), matches_per_pair(mpp) {
  if (!(defect_win > mutual_cooperate && mutual_cooperate > mutual_defect && mutual_defect >= cooperate_loss)) {
    stringstream ss;
    ss << "payoffs must satisfy defect_win(" << defect_win << ") > mutual_cooperate(" << mutual_cooperate
       << ") > mutual_defect(" << mutual_defect << ") >= cooperate_loss(" << cooperate_loss << ")";
    throw configuration_error(ss.str());
  }

  if (rounds_per_match <= 0 || matches_per_pair <= 0) {
    throw configuration_error("rounds per match and matches per pair must be positive, got " + to_string(rounds_per_match) + " and " + to_string(matches_per_pair));
  }

  // a match total must fit in an int
  long long largest = max({llabs(defect_win), llabs(mutual_cooperate), llabs(mutual_defect), llabs(cooperate_loss)});
  if (largest * rounds_per_match > INT_MAX) {
    throw configuration_error("payoff " + to_string(largest) + " over " + to_string(rounds_per_match) + " rounds overflows a match total");
  }
}

score_pair payoff_model::payoff(action a, action b) const {
  if (a == DEFECT && b == DEFECT) {
    return {mutual_defect, mutual_defect};
  } else if (a == COOPERATE && b == COOPERATE) {
    return {mutual_cooperate, mutual_cooperate};
  } else if (a == DEFECT && b == COOPERATE) {
    return {defect_win, cooperate_loss};
  } else {
    return {cooperate_loss, defect_win};
  }
}

string payoff_model::str() const {
  stringstream ss;
  ss << "payoff_model(defect_win=" << defect_win
     << ", mutual_cooperate=" << mutual_cooperate
     << ", mutual_defect=" << mutual_defect
     << ", cooperate_loss=" << cooperate_loss
     << ", rounds=" << rounds_per_match
     << ", matches=" << matches_per_pair << ")";
  return ss.str();
}
