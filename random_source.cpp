#include "random_source.hpp"

#include <memory>

using namespace std;

mt_random_source::mt_random_source() : distribution(0, 1) {
  random_device rd;
  gen.seed(rd());
}

mt_random_source::mt_random_source(unsigned int s) : gen(s), distribution(0, 1) {}

double mt_random_source::u01() {
  m.Lock();
  double x = distribution(gen);
  m.Unlock();
  return x;
}

void mt_random_source::seed(unsigned int s) {
  m.Lock();
  gen.seed(s);
  distribution.reset();
  m.Unlock();
}

shared_ptr<mt_random_source> &get_random_engine() {
  static shared_ptr<mt_random_source> gen(new mt_random_source);
  return gen;
}

random_source_ptr default_random_source() {
  return get_random_engine();
}

void seed_default_random_source(unsigned int s) {
  get_random_engine()->seed(s);
}
