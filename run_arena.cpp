#include <cstring>
#include <iostream>
#include <string>

#include "arena.hpp"
#include "errors.hpp"
#include "payoff_model.hpp"
#include "random_source.hpp"
#include "strategy.hpp"
#include "strategy_catalog.hpp"

using namespace std;

const string version = "v0.1";

const char *next_arg(int argc, char **argv, int &i) {
  if (i + 1 >= argc) throw configuration_error(string("missing value for ") + argv[i]);
  return argv[++i];
}

int int_arg(int argc, char **argv, int &i) {
  string key = argv[i];
  return parse_int(key, next_arg(argc, argv, i));
}

int main(int argc, char **argv) {
  string mode = "tournament";
  int defect_win = 5;
  int mutual_cooperate = 3;
  int mutual_defect = 1;
  int cooperate_loss = 0;
  int rounds = 500;
  int matches = 30;
  string agent1 = "TitForTat";
  string agent2 = "Random";
  string log_file = "logs/tournament.log";
  string results_file = "logs/tournament_results.txt";
  bool verbose = false;

  try {
    for (int i = 1; i < argc; i++) {
      if (!strcmp(argv[i], "version")) {
        cout << version << endl;
        return 0;
      } else if (!strcmp(argv[i], "list")) {
        for (auto name : catalog_names()) cout << name << endl;
        return 0;
      } else if (!strcmp(argv[i], "mode")) {
        mode = next_arg(argc, argv, i);
        if (mode != "individual" && mode != "tournament") throw configuration_error("mode must be individual or tournament, got " + mode);
      } else if (!strcmp(argv[i], "defect_win")) {
        defect_win = int_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "mutual_cooperate")) {
        mutual_cooperate = int_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "mutual_defect")) {
        mutual_defect = int_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "cooperate_loss")) {
        cooperate_loss = int_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "rounds")) {
        rounds = int_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "matches")) {
        matches = int_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "agent1")) {
        agent1 = next_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "agent2")) {
        agent2 = next_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "log")) {
        log_file = next_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "results")) {
        results_file = next_arg(argc, argv, i);
      } else if (!strcmp(argv[i], "seed")) {
        seed_default_random_source(int_arg(argc, argv, i));
      } else if (!strcmp(argv[i], "verbose")) {
        verbose = true;
      } else {
        throw configuration_error(string("unknown argument: ") + argv[i]);
      }
    }
  } catch (configuration_error &e) {
    cerr << "Arena: configuration error: " << e.what() << endl;
    return 1;
  }

  try {
    payoff_model config(defect_win, mutual_cooperate, mutual_defect, cooperate_loss, rounds, matches);

    if (mode == "individual") {
      run_individual_match(config, make_strategy(agent1), make_strategy(agent2), log_file, verbose);
    } else {
      run_tournament(config, all_strategies(), log_file, results_file, verbose);
    }
  } catch (configuration_error &e) {
    cerr << "Arena: configuration error: " << e.what() << endl;
    return 1;
  } catch (protocol_violation &e) {
    cerr << "Arena: protocol violation: " << e.what() << endl;
    return 1;
  } catch (roster_error &e) {
    cerr << "Arena: roster error: " << e.what() << endl;
    return 1;
  } catch (runtime_error &e) {
    cerr << "Arena: " << mode << " failed: " << e.what() << endl;
    return 1;
  }

  return 0;
}
