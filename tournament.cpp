#include "tournament.hpp"

#include <set>
#include <sstream>

#include "payoff_model.hpp"
#include "strategy.hpp"
#include "utility.hpp"

using namespace std;

vector<string> deduplicate_names(vector<strategy_ptr> &roster) {
  set<string> taken;
  for (auto s : roster) taken.insert(s->name);

  hm<string, int> name_counts;
  set<string> seen;
  vector<string> names;

  for (auto s : roster) {
    if (!seen.count(s->name)) {
      seen.insert(s->name);
      names.push_back(s->name);
      continue;
    }

    string base = s->name;
    string renamed;
    do {
      renamed = base + "_" + to_string(++name_counts[base]);
    } while (taken.count(renamed));

    taken.insert(renamed);
    seen.insert(renamed);
    s->name = renamed;
    names.push_back(renamed);
  }

  return names;
}

string export_results(const payoff_model &config, const tournament_result &result) {
  stringstream ss;

  ss << "Iterated dilemma tournament results" << endl
     << "time: " << timestamp() << endl
     << "payoffs: defect_win=" << config.defect_win
     << ", mutual_cooperate=" << config.mutual_cooperate
     << ", mutual_defect=" << config.mutual_defect
     << ", cooperate_loss=" << config.cooperate_loss << endl
     << "rounds per match: " << config.rounds_per_match
     << ", matches per pair: " << config.matches_per_pair << endl
     << endl
     << "final ranking:" << endl;

  for (int i = 0; i < result.ranking.size(); i++) {
    ss << (i + 1) << ". " << result.ranking[i].name << ": " << format_fixed(result.ranking[i].score) << endl;
  }

  return ss.str();
}
