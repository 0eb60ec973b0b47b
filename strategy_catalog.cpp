#include "strategy_catalog.hpp"

#include <utility>

#include "adaptive_strategies.hpp"
#include "basic_strategies.hpp"
#include "errors.hpp"
#include "memory_strategies.hpp"
#include "pattern_strategies.hpp"
#include "probing_strategies.hpp"
#include "punishment_strategies.hpp"
#include "utility.hpp"

using namespace std;

template <typename T>
strategy_f plain() {
  return [](random_source_ptr) -> strategy_ptr { return strategy_ptr(new T); };
}

template <typename T>
strategy_f seeded(const string &name) {
  return [name](random_source_ptr r) -> strategy_ptr { return strategy_ptr(new T(name, r)); };
}

const vector<pair<string, strategy_f>> &registry() {
  static const vector<pair<string, strategy_f>> entries = {
      {"TitForTat", plain<tit_for_tat>()},
      {"AlwaysDefect", plain<always_defect>()},
      {"AlwaysCooperate", plain<always_cooperate>()},
      {"Random", seeded<random_strategy>("Random")},
      {"ForgivingTitForTat", plain<forgiving_tit_for_tat>()},
      {"Gradual", plain<gradual>()},
      {"PatternDetector", plain<pattern_detector>()},
      {"AdaptiveAgent", plain<adaptive_agent>()},
      {"WinStayLoseShift", plain<win_stay_lose_shift>()},
      {"TwoCoopOneDefect", plain<two_coop_one_defect>()},
      {"RewardPunishment", plain<reward_punishment>()},
      {"EscapeTiger", plain<escape_tiger>()},
      {"Inching", seeded<inching>("Inching")},
      {"TrustBuilding", seeded<trust_building>("TrustBuilding")},
      {"Grudge", plain<grudge>()},
      {"PunishmentEscalation", plain<punishment_escalation>()},
      {"Consensus", seeded<consensus>("Consensus")},
      {"Probe", seeded<probe>("Probe")},
      {"Capped", seeded<capped>("Capped")},
      {"ShortMemory", seeded<short_memory>("ShortMemory")},
      {"MediumMemory", seeded<medium_memory>("MediumMemory")},
      {"LongMemory", seeded<long_memory>("LongMemory")},
      {"TitForTatStartMediumMemory", seeded<tit_for_tat_start_medium_memory>("TitForTatStartMediumMemory")},
      {"AdaptivePunishment", plain<adaptive_punishment>()},
      {"GradualForgiving", seeded<gradual_forgiving>("GradualForgiving")},
      {"PatternMatchingTitForTat", plain<pattern_matching_tit_for_tat>()},
      {"FrequencyAnalysis", plain<frequency_analysis>()},
      {"RhythmDetector", seeded<rhythm_detector>("RhythmDetector")},
      {"Hybrid", plain<hybrid>()},
      {"Pavlov", plain<pavlov>()}};
  return entries;
}

vector<string> catalog_names() {
  vector<string> names;
  for (auto &e : registry()) names.push_back(e.first);
  return names;
}

strategy_ptr make_strategy(const string &name, random_source_ptr rng) {
  for (auto &e : registry()) {
    if (e.first == name) return e.second(rng);
  }

  throw configuration_error("unknown strategy name: " + name + ", available: " + join_string(catalog_names(), ", "));
}

vector<strategy_ptr> all_strategies(random_source_ptr rng) {
  vector<strategy_ptr> roster;
  for (auto &e : registry()) roster.push_back(e.second(rng));
  return roster;
}
