#ifndef CNPJ_FORGE_CNPJ_H_
#define CNPJ_FORGE_CNPJ_H_

#include <cstdint>
#include <cstdio>
#include <string>

#include "CNPJUtil.hpp"

// A checksum-correct identifier. The only way to build one is from a base12,
// so the check pair always matches the base.
class CNPJ {
 public:
  static const int64_t kBase12Limit = 1000000000000LL;
  static const int64_t kRootMax = 99999999;
  static const int kBranchMax = 9999;

  CNPJ() : base12_(0), d1_(0), d2_(0) {
    CNPJUtil::ComputeCheckPair(base12_, &d1_, &d2_);
  }

  static CNPJ FromBase12(int64_t base12) {
    return CNPJ(base12);
  }

  static CNPJ FromParts(int64_t root, int branch) {
    return CNPJ(root * 10000 + branch);
  }

  int64_t base12() const { return base12_; }
  int64_t root() const { return base12_ / 10000; }
  int branch() const { return static_cast<int>(base12_ % 10000); }
  int first_check_digit() const { return d1_; }
  int second_check_digit() const { return d2_; }

  std::string Digits() const {
    char buffer[16];
    snprintf(buffer, sizeof(buffer), "%012lld%d%d",
             static_cast<long long>(base12_), d1_, d2_);
    return std::string(buffer);
  }

  std::string Masked() const {
    return CNPJUtil::Mask(Digits());
  }

 private:
  explicit CNPJ(int64_t base12) : base12_(base12) {
    CNPJUtil::ComputeCheckPair(base12_, &d1_, &d2_);
  }

  int64_t base12_;
  int d1_;
  int d2_;
};

#endif  // CNPJ_FORGE_CNPJ_H_
