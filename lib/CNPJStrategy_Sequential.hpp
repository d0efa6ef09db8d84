#ifndef CNPJ_FORGE_CNPJ_STRATEGY_SEQUENTIAL_H_
#define CNPJ_FORGE_CNPJ_STRATEGY_SEQUENTIAL_H_

#include <cstdint>
#include <string>

#include "CNPJStrategy.hpp"

// Walks the arithmetic progression start, start + step, ... (< end). With
// sharding, the k-th term belongs to shard k % shards_total, so shards are
// disjoint and together cover the sweep exactly once.
class CNPJStrategy_Sequential : public CNPJStrategy {
 public:
  struct Options {
    int64_t start = 0;
    int64_t end = CNPJ::kBase12Limit;
    int64_t step = 1;
    int64_t count = kUnbounded;
    int shard_index = 0;
    int shards_total = 1;
  };

  CNPJStrategy_Sequential(const Options& options,
                          const CNPJSequenceFilter& filter)
      : CNPJStrategy(filter), options_(options), k_(options.shard_index) {}

  bool Next(CNPJ* cnpj) override {
    while (!TargetReached() && !RangeExhausted()) {
      int64_t base12 = options_.start + k_ * options_.step;
      k_ += options_.shards_total;
      if (Emit(base12, cnpj)) {
        return true;
      }
    }
    return false;
  }

  int64_t Target() const override { return options_.count; }

  std::string Name() const override { return "sequential"; }

  bool RangeExhausted() const { return k_ >= TermCount(); }

  // Number of terms of the progression below end. No intermediate value
  // exceeds end - start, whatever the step.
  int64_t TermCount() const {
    if (options_.start >= options_.end) {
      return 0;
    }
    return (options_.end - options_.start - 1) / options_.step + 1;
  }

 private:
  Options options_;
  // Index of the next term of the progression to look at.
  int64_t k_;
};

#endif  // CNPJ_FORGE_CNPJ_STRATEGY_SEQUENTIAL_H_
