#include "round_robin_tournament.hpp"

#include <algorithm>
#include <chrono>
#include <set>

#include "errors.hpp"
#include "payoff_model.hpp"
#include "strategy.hpp"
#include "utility.hpp"

using namespace std;

round_robin_tournament::round_robin_tournament(ostream *output, ostream *trace) : tournament(), enable_output(output), trace_output(trace) {}

tournament_result round_robin_tournament::run(const payoff_model &config, vector<strategy_ptr> &roster) {
  if (roster.size() < 2) throw roster_error("a tournament needs at least two strategies, got " + to_string(roster.size()));

  // every entry must be its own instance
  set<strategy *> instances;
  for (int i = 0; i < roster.size(); i++) {
    if (!instances.insert(roster[i].get()).second) throw roster_error("strategy " + roster[i]->name + " appears more than once in the roster, at position " + to_string(i + 1));
  }

  auto start_time = chrono::steady_clock::now();
  vector<string> names = deduplicate_names(roster);
  int n = roster.size();
  int total_pairs = n * (n - 1) / 2;
  int completed = 0;

  if (enable_output) {
    *enable_output << "Tournament: start" << endl
                   << "Tournament: config: " << config.str() << endl
                   << "Tournament: roster: " << join_string(names, ", ") << endl;
  }

  tournament_result res;
  vector<vec> pair_scores(n);
  match m(config, trace_output);

  for (int i = 0; i < n; i++) {
    for (int j = i + 1; j < n; j++) {
      if (enable_output) *enable_output << "Tournament: " << names[i] << " vs " << names[j] << ": start" << endl;

      pair_record rec;
      rec.name_a = names[i];
      rec.name_b = names[j];
      rec.result = m.run(roster[i], roster[j]);

      auto q = rec.result.quartile_scores();
      rec.quartile_a = q.first;
      rec.quartile_b = q.second;
      pair_scores[i].push_back(q.first);
      pair_scores[j].push_back(q.second);

      completed++;
      if (enable_output) {
        *enable_output << "Tournament: " << names[i] << " vs " << names[j] << ":" << endl
                       << "  quartile scores: " << names[i] << "=" << rec.quartile_a << ", " << names[j] << "=" << rec.quartile_b << endl
                       << "  all scores: " << names[i] << "=" << rec.result.scores_a << ", " << names[j] << "=" << rec.result.scores_b << endl
                       << "  outcome: " << rec.result.win_count_info() << endl
                       << "Tournament: completed " << completed << "/" << total_pairs
                       << " (" << format_fixed(100.0 * completed / total_pairs, 1) << "%)" << endl;
      }

      res.pairs.push_back(rec);
    }
  }

  for (int i = 0; i < n; i++) {
    double score = mean(pair_scores[i]);
    res.scores[names[i]] = score;
    res.ranking.push_back({names[i], score});
  }

  stable_sort(res.ranking.begin(), res.ranking.end(), [](const ranking_entry &a, const ranking_entry &b) -> bool { return a.score > b.score; });

  res.elapsed_seconds = chrono::duration<double>(chrono::steady_clock::now() - start_time).count();

  if (enable_output) {
    *enable_output << "Tournament: done" << endl
                   << "Tournament: elapsed " << format_fixed(res.elapsed_seconds) << " seconds" << endl
                   << "Tournament: final ranking:" << endl;
    for (int i = 0; i < res.ranking.size(); i++) {
      *enable_output << "  " << (i + 1) << ". " << res.ranking[i].name << " - " << format_fixed(res.ranking[i].score) << endl;
    }
  }

  return res;
}
