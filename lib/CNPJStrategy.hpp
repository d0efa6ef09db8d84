#ifndef CNPJ_FORGE_CNPJ_STRATEGY_H_
#define CNPJ_FORGE_CNPJ_STRATEGY_H_

#include <cstdint>
#include <string>

#include "CNPJ.hpp"
#include "CNPJSequenceFilter.hpp"

// A lazy, pull based sequence of identifiers. Nothing is materialized; each
// call to Next() does just enough work to produce one more value.
class CNPJStrategy {
 public:
  static const int64_t kUnbounded = -1;

  explicit CNPJStrategy(const CNPJSequenceFilter& filter) : filter_(filter) {}

  virtual ~CNPJStrategy() {}

  // To be implemented in the derived classes. Writes the next identifier and
  // returns true, or returns false once the sequence is over (target reached
  // or space exhausted).
  virtual bool Next(CNPJ* cnpj) = 0;

  // How many identifiers the run asked for, kUnbounded if it runs until the
  // space is exhausted.
  virtual int64_t Target() const = 0;

  virtual std::string Name() const = 0;

  // Number of identifiers handed out so far.
  int64_t emitted() const { return emitted_; }

 protected:
  // Filters the base and, when it passes, builds the identifier and counts
  // it. Rejected bases never count toward the target.
  bool Emit(int64_t base12, CNPJ* cnpj) {
    if (filter_.Rejects(base12)) {
      return false;
    }
    *cnpj = CNPJ::FromBase12(base12);
    ++emitted_;
    return true;
  }

  bool TargetReached() const {
    return Target() != kUnbounded && emitted_ >= Target();
  }

  CNPJSequenceFilter filter_;
  int64_t emitted_ = 0;
};

#endif  // CNPJ_FORGE_CNPJ_STRATEGY_H_
