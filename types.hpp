#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

class strategy;
class random_source;
class payoff_model;
class match;
class tournament;

typedef std::shared_ptr<strategy> strategy_ptr;
typedef std::shared_ptr<random_source> random_source_ptr;
typedef std::shared_ptr<tournament> tournament_ptr;

enum action : int {
  COOPERATE = 0,
  DEFECT = 1
};

typedef std::vector<action> history;
typedef std::vector<double> vec;
typedef std::pair<int, int> score_pair;
typedef std::function<strategy_ptr(random_source_ptr)> strategy_f;

template <typename K, typename V>
using hm = std::unordered_map<K, V>;
