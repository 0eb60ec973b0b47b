#include "match.hpp"

#include <sstream>

#include "errors.hpp"
#include "payoff_model.hpp"
#include "strategy.hpp"
#include "utility.hpp"

using namespace std;

static vec to_vec(const vector<int> &x) {
  return vec(x.begin(), x.end());
}

void match_result::add_match(int score_a, int score_b, const history &history_a, const history &history_b) {
  scores_a.push_back(score_a);
  scores_b.push_back(score_b);
  histories_a.push_back(history_a);
  histories_b.push_back(history_b);
}

int match_result::size() const {
  return scores_a.size();
}

pair<double, double> match_result::average_scores() const {
  return {mean(to_vec(scores_a)), mean(to_vec(scores_b))};
}

pair<int, int> match_result::min_scores() const {
  if (scores_a.empty()) return {0, 0};
  return {(int)min(to_vec(scores_a)), (int)min(to_vec(scores_b))};
}

pair<double, double> match_result::median_scores() const {
  if (scores_a.empty()) return {0, 0};
  return {quantile(to_vec(scores_a), 0.5), quantile(to_vec(scores_b), 0.5)};
}

pair<double, double> match_result::quartile_scores() const {
  if (scores_a.empty()) return {0, 0};
  return {quantile(to_vec(scores_a), 0.25), quantile(to_vec(scores_b), 0.25)};
}

win_count match_result::wins() const {
  win_count res = {0, 0, 0};
  for (int i = 0; i < size(); i++) {
    if (scores_a[i] > scores_b[i]) {
      res.wins_a++;
    } else if (scores_b[i] > scores_a[i]) {
      res.wins_b++;
    } else {
      res.draws++;
    }
  }
  return res;
}

string match_result::win_count_info() const {
  win_count w = wins();
  stringstream ss;
  ss << "A wins: " << w.wins_a << " B wins: " << w.wins_b << " draws: " << w.draws;
  return ss.str();
}

string match_result::summary() const {
  auto avg = average_scores();
  auto low = min_scores();
  stringstream ss;
  ss << "matches: " << size() << endl
     << "A scores: " << scores_a << ", average: " << format_fixed(avg.first) << ", min: " << low.first << endl
     << "B scores: " << scores_b << ", average: " << format_fixed(avg.second) << ", min: " << low.second << endl
     << "outcome: " << win_count_info();
  return ss.str();
}

match::match(const payoff_model &c, ostream *output) : config(c), enable_output(output) {}

match_result match::run(strategy_ptr a, strategy_ptr b) {
  match_result result;

  if (enable_output) *enable_output << "Match: " << a->name << " vs " << b->name << ": start" << endl;

  for (int idx = 0; idx < config.matches_per_pair; idx++) {
    a->reset();
    b->reset();

    int total_a = 0, total_b = 0;
    history history_a, history_b;
    play_single(*a, *b, total_a, total_b, history_a, history_b);
    result.add_match(total_a, total_b, history_a, history_b);

    if (enable_output) *enable_output << "Match: " << (idx + 1) << " done, scores: A=" << total_a << ", B=" << total_b << endl;
  }

  if (enable_output) *enable_output << "Match: " << a->name << " vs " << b->name << ": done" << endl
                                    << result.summary() << endl;

  return result;
}

void match::play_single(strategy &a, strategy &b, int &total_a, int &total_b, history &history_a, history &history_b) {
  history_a.reserve(config.rounds_per_match);
  history_b.reserve(config.rounds_per_match);

  for (int round = 0; round < config.rounds_per_match; round++) {
    action action_a = a.decide(history_a, history_b);
    action action_b = b.decide(history_b, history_a);

    if (!valid_action(action_a) || !valid_action(action_b)) {
      stringstream ss;
      ss << "invalid action in round " << (round + 1) << ": " << a.name << "=" << (int)action_a << ", " << b.name << "=" << (int)action_b;
      throw protocol_violation(ss.str());
    }

    score_pair reward = config.payoff(action_a, action_b);
    history_a.push_back(action_a);
    history_b.push_back(action_b);
    total_a += reward.first;
    total_b += reward.second;

    if (enable_output) {
      *enable_output << "Match: round " << (round + 1) << ": A=" << action_symbol(action_a) << ", B=" << action_symbol(action_b)
                     << ", payoff: A=" << reward.first << ", B=" << reward.second << endl;
    }
  }
}
