#include "utility.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

using namespace std;

MutexType::MutexType() { omp_init_lock(&lock); }
MutexType::~MutexType() { omp_destroy_lock(&lock); }
void MutexType::Lock() { omp_set_lock(&lock); }
void MutexType::Unlock() { omp_unset_lock(&lock); }

MutexType::MutexType(const MutexType &) { omp_init_lock(&lock); }
MutexType &MutexType::operator=(const MutexType &) { return *this; }

string join_string(const vector<string> vec, string delim) {
  if (vec.empty()) return "";

  stringstream ss;
  for (int i = 0; i < vec.size() - 1; i++) ss << vec[i] << delim;
  ss << vec.back();

  return ss.str();
}

double cat(function<double(double, double)> f, vec x) {
  if (x.empty()) throw invalid_argument("cat: empty sample");
  double y = x[0];
  for (int i = 1; i < x.size(); i++) y = f(y, x[i]);
  return y;
}

double quantile(vec x, double r) {
  if (x.empty()) throw invalid_argument("quantile: empty sample");
  sort(x.begin(), x.end());
  int idx = min((int)(r * x.size()), (int)x.size() - 1);
  return x[idx];
}

double min(vec x) {
  return cat([](double a, double b) { return fmin(a, b); }, x);
}

double max(vec x) {
  return cat([](double a, double b) { return fmax(a, b); }, x);
}

double sum(vec x) {
  return accumulate(x.begin(), x.end(), 0.0);
}

double mean(vec x) {
  if (x.empty()) return 0;
  return sum(x) / x.size();
}

string format_fixed(double x, int digits) {
  stringstream ss;
  ss << fixed << setprecision(digits) << x;
  return ss.str();
}

string timestamp(const string &format) {
  time_t now = time(NULL);
  tm local;
  localtime_r(&now, &local);

  stringstream ss;
  ss << put_time(&local, format.c_str());
  return ss.str();
}
