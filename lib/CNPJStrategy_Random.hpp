#ifndef CNPJ_FORGE_CNPJ_STRATEGY_RANDOM_H_
#define CNPJ_FORGE_CNPJ_STRATEGY_RANDOM_H_

#include <cmath>
#include <cstdint>
#include <random>
#include <string>

#include "CNPJStrategy.hpp"

// Samples roots in [root_min, root_max] and branches in [1, 9999] (or a fixed
// branch). Draws are independent, so the same identifier may come up twice.
class CNPJStrategy_Random : public CNPJStrategy {
 public:
  struct Options {
    int64_t count = 1;
    int64_t root_min = 35000000;
    int64_t root_max = 99999999;
    bool random_branch = false;
    int fixed_branch = 1;
    bool bias_upper = false;
  };

  CNPJStrategy_Random(const Options& options, const CNPJSequenceFilter& filter,
                      std::mt19937_64 rng)
      : CNPJStrategy(filter),
        options_(options),
        rng_(rng),
        root_dist_(options.root_min, options.root_max),
        branch_dist_(1, CNPJ::kBranchMax) {}

  bool Next(CNPJ* cnpj) override {
    if (TargetReached()) {
      return false;
    }
    // Resample until the filter accepts. Config validation guarantees at
    // least one acceptable base exists.
    while (!Emit(DrawRoot() * 10000 + DrawBranch(), cnpj)) {
    }
    return true;
  }

  int64_t Target() const override { return options_.count; }

  std::string Name() const override { return "random"; }

 private:
  int64_t DrawRoot() {
    if (!options_.bias_upper) {
      return root_dist_(rng_);
    }
    // Triangular density with its mode at root_max: P(root <= x) grows as
    // ((x - min) / width)^2, so higher roots are proportionally more likely.
    double width = static_cast<double>(options_.root_max - options_.root_min + 1);
    int64_t offset = static_cast<int64_t>(std::sqrt(unit_dist_(rng_)) * width);
    int64_t root = options_.root_min + offset;
    return root > options_.root_max ? options_.root_max : root;
  }

  int DrawBranch() {
    return options_.random_branch ? branch_dist_(rng_) : options_.fixed_branch;
  }

  Options options_;
  std::mt19937_64 rng_;
  std::uniform_int_distribution<int64_t> root_dist_;
  std::uniform_int_distribution<int> branch_dist_;
  std::uniform_real_distribution<double> unit_dist_;
};

#endif  // CNPJ_FORGE_CNPJ_STRATEGY_RANDOM_H_
