#include "arena.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "errors.hpp"
#include "payoff_model.hpp"
#include "round_robin_tournament.hpp"
#include "strategy.hpp"
#include "utility.hpp"

using namespace std;

int parse_int(const string &key, const string &value) {
  const char *s = value.c_str();
  char *end;
  errno = 0;
  long x = strtol(s, &end, 10);

  if (*s == '\0' || *end != '\0') throw configuration_error("invalid integer for " + key + ": " + value);
  if (errno == ERANGE || x < INT_MIN || x > INT_MAX) throw configuration_error("integer out of range for " + key + ": " + value);
  return x;
}

void ensure_parent_directory(const string &path) {
  size_t pos = path.find_last_of('/');
  if (pos == string::npos || pos == 0) return;

  string dir = path.substr(0, pos);
  ensure_parent_directory(dir);

  if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
    throw runtime_error("Arena: failed to create directory " + dir + ": " + strerror(errno));
  }
}

unique_ptr<ofstream> open_log(const string &log_file) {
  if (log_file.empty()) return nullptr;

  ensure_parent_directory(log_file);
  unique_ptr<ofstream> f(new ofstream(log_file, ios::app));
  if (!f->is_open()) throw runtime_error("Arena: failed to open log file " + log_file);
  return f;
}

string save_results(const payoff_model &config, const tournament_result &res, string filename) {
  if (filename.empty()) filename = "tournament_results_" + timestamp("%Y%m%d_%H%M%S") + ".txt";

  ensure_parent_directory(filename);
  ofstream f(filename);
  if (!f.is_open()) throw runtime_error("Arena: failed to open results file " + filename);

  f << export_results(config, res);
  f.close();

  cout << "Arena: results saved to " << filename << endl;
  return filename;
}

match_result run_individual_match(const payoff_model &config, strategy_ptr a, strategy_ptr b, string log_file, bool verbose) {
  auto flog = open_log(log_file);

  cout << "Arena: individual match: " << a->name << " vs " << b->name << endl
       << "Arena: config: " << config.str() << endl;

  match m(config, verbose && flog ? flog.get() : nullptr);
  match_result res = m.run(a, b);

  cout << "Arena: result:" << endl
       << res.summary() << endl;

  if (flog) {
    *flog << "Arena: " << timestamp() << ": individual match " << a->name << " vs " << b->name << endl
          << "Arena: config: " << config.str() << endl
          << res.summary() << endl;
    for (int i = 0; i < res.size(); i++) {
      *flog << "Arena: match " << (i + 1) << ": A " << history_string(res.histories_a[i]) << endl
            << "Arena: match " << (i + 1) << ": B " << history_string(res.histories_b[i]) << endl;
    }
  }

  cout << "Arena: individual match done" << endl;
  return res;
}

tournament_result run_tournament(const payoff_model &config, vector<strategy_ptr> roster, string log_file, string results_file, bool verbose) {
  auto flog = open_log(log_file);

  cout << "Arena: tournament with " << roster.size() << " strategies" << endl
       << "Arena: config: " << config.str() << endl;

  if (flog) *flog << "Arena: " << timestamp() << ": tournament start" << endl;

  round_robin_tournament t(flog.get(), verbose ? flog.get() : nullptr);
  tournament_result res = t.run(config, roster);

  cout << "Arena: tournament done in " << format_fixed(res.elapsed_seconds) << " seconds" << endl
       << "Arena: final ranking:" << endl;
  for (int i = 0; i < res.ranking.size(); i++) {
    cout << (i + 1) << ". " << res.ranking[i].name << ": " << format_fixed(res.ranking[i].score) << endl;
  }

  save_results(config, res, results_file);
  return res;
}
