#ifndef CNPJ_FORGE_CNPJ_SEQUENCE_FILTER_H_
#define CNPJ_FORGE_CNPJ_SEQUENCE_FILTER_H_

#include <cstdint>

// Rejects bases nobody would ever register: all twelve digits identical
// (000000000000, 111111111111, ...) and branch 0000. A disabled filter lets
// everything through, which is what exhaustive sweeps want.
class CNPJSequenceFilter {
 public:
  explicit CNPJSequenceFilter(bool enabled = true) : enabled_(enabled) {}

  bool enabled() const { return enabled_; }

  bool Rejects(int64_t base12) const {
    if (!enabled_) {
      return false;
    }
    return IsDegenerate(base12) || base12 % 10000 == 0;
  }

  static bool IsDegenerate(int64_t base12) {
    int last = static_cast<int>(base12 % 10);
    for (int i = 0; i < 12; ++i) {
      if (base12 % 10 != last) {
        return false;
      }
      base12 /= 10;
    }
    return true;
  }

 private:
  bool enabled_;
};

#endif  // CNPJ_FORGE_CNPJ_SEQUENCE_FILTER_H_
