#pragma once

#include <omp.h>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "types.hpp"

struct MutexType {
  MutexType();
  ~MutexType();
  void Lock();
  void Unlock();

  MutexType(const MutexType &);
  MutexType &operator=(const MutexType &);

 public:
  omp_lock_t lock;
};

template <typename T>
std::ostream &operator<<(std::ostream &os, const std::vector<T> &x) {
  os << "[";
  for (int i = 0; i < x.size(); i++) os << (i ? ", " : "") << x[i];
  return os << "]";
};

std::string join_string(const std::vector<std::string> vec, std::string delim);

double cat(std::function<double(double, double)> f, vec x);

// value at rank floor(r * n) of the sorted sample
double quantile(vec x, double r);

double min(vec x);
double max(vec x);
double sum(vec x);
double mean(vec x);

std::string format_fixed(double x, int digits = 2);
std::string timestamp(const std::string &format = "%Y-%m-%d %H:%M:%S");
