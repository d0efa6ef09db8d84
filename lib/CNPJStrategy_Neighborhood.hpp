#ifndef CNPJ_FORGE_CNPJ_STRATEGY_NEIGHBORHOOD_H_
#define CNPJ_FORGE_CNPJ_STRATEGY_NEIGHBORHOOD_H_

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>

#include "CNPJStrategy.hpp"

// Visits the roots around a base root in a seeded pseudo random order without
// ever repeating one. The order is the affine permutation
//   i -> (a * i + b) mod N,  gcd(a, N) = 1
// over the N candidate roots, so only (a, b, i) has to be kept in memory.
// The branch is always 0001.
class CNPJStrategy_Neighborhood : public CNPJStrategy {
 public:
  static const int kBranch = 1;

  struct Options {
    int64_t count = 1;
    int64_t base_root = 0;
    int64_t spread = 30000000;
  };

  CNPJStrategy_Neighborhood(const Options& options,
                            const CNPJSequenceFilter& filter,
                            std::mt19937_64 rng)
      : CNPJStrategy(filter), options_(options) {
    lo_ = std::max<int64_t>(0, options.base_root - options.spread);
    int64_t hi = options.base_root + options.spread;
    if (hi > CNPJ::kRootMax) {
      hi = CNPJ::kRootMax;
    }
    n_ = hi - lo_ + 1;
    a_ = PickMultiplier(n_, &rng);
    b_ = std::uniform_int_distribution<int64_t>(0, n_ - 1)(rng);
  }

  bool Next(CNPJ* cnpj) override {
    while (!TargetReached() && i_ < n_) {
      int64_t root = lo_ + (a_ * i_ + b_) % n_;
      ++i_;
      if (Emit(root * 10000 + kBranch, cnpj)) {
        return true;
      }
    }
    return false;
  }

  int64_t Target() const override { return options_.count; }

  std::string Name() const override { return "neighborhood"; }

  int64_t candidate_count() const { return n_; }
  int64_t first_root() const { return lo_; }

 private:
  static int64_t Gcd(int64_t x, int64_t y) {
    while (y != 0) {
      int64_t t = x % y;
      x = y;
      y = t;
    }
    return x;
  }

  // Random multiplier coprime to n. Tiny ranges fall back to the identity.
  static int64_t PickMultiplier(int64_t n, std::mt19937_64* rng) {
    if (n <= 2) {
      return 1;
    }
    std::uniform_int_distribution<int64_t> dist(1, n - 1);
    while (true) {
      int64_t a = dist(*rng);
      if (Gcd(a, n) == 1) {
        return a;
      }
    }
  }

  Options options_;
  int64_t lo_;
  int64_t n_;
  int64_t a_;
  int64_t b_;
  int64_t i_ = 0;
};

#endif  // CNPJ_FORGE_CNPJ_STRATEGY_NEIGHBORHOOD_H_
