#include <gtest/gtest.h>

#include <string>

#include "CNPJ.hpp"
#include "CNPJUtil.hpp"

// Published identifiers used as golden vectors.
TEST(CNPJUtilTest, KnownValidIdentifiers) {
  EXPECT_TRUE(CNPJUtil::IsValid("11222333000181"));
  EXPECT_TRUE(CNPJUtil::IsValid("00000000000191"));
  EXPECT_TRUE(CNPJUtil::IsValid("12345678000195"));
}

TEST(CNPJUtilTest, CheckDigitsOfKnownBase) {
  EXPECT_EQ(CNPJUtil::FirstCheckDigit(123456780001LL), 9);
  EXPECT_EQ(CNPJUtil::SecondCheckDigit(1234567800019LL), 5);

  int d1 = -1, d2 = -1;
  CNPJUtil::ComputeCheckPair(112223330001LL, &d1, &d2);
  EXPECT_EQ(d1, 8);
  EXPECT_EQ(d2, 1);
}

// Remainders 0 and 1 both map to a 0 check digit.
TEST(CNPJUtilTest, LowRemaindersGiveZero) {
  EXPECT_EQ(CNPJUtil::FirstCheckDigit(0), 0);
  EXPECT_EQ(CNPJUtil::SecondCheckDigit(0), 0);
  EXPECT_TRUE(CNPJUtil::IsValid("00000000000000"));
}

TEST(CNPJUtilTest, ComputedPairAlwaysValidates) {
  // Walk the whole base12 space with a large prime stride.
  for (int64_t base12 = 0; base12 < 1000000000000LL; base12 += 99999989LL) {
    CNPJ cnpj = CNPJ::FromBase12(base12);
    std::string digits = cnpj.Digits();
    ASSERT_TRUE(CNPJUtil::IsValid(digits)) << digits;

    std::string bad_first = digits;
    bad_first[12] = static_cast<char>('0' + (bad_first[12] - '0' + 1) % 10);
    EXPECT_FALSE(CNPJUtil::IsValid(bad_first)) << bad_first;

    std::string bad_second = digits;
    bad_second[13] = static_cast<char>('0' + (bad_second[13] - '0' + 1) % 10);
    EXPECT_FALSE(CNPJUtil::IsValid(bad_second)) << bad_second;
  }
}

TEST(CNPJUtilTest, IsValidRejectsMalformedInput) {
  EXPECT_FALSE(CNPJUtil::IsValid(""));
  EXPECT_FALSE(CNPJUtil::IsValid("1122233300018"));
  EXPECT_FALSE(CNPJUtil::IsValid("112223330001811"));
  EXPECT_FALSE(CNPJUtil::IsValid("11.222.333/0001-81"));
  EXPECT_FALSE(CNPJUtil::IsValid("1122233300018a"));
}

TEST(CNPJUtilTest, ExtractDigitsToleratesMask) {
  std::string digits;
  EXPECT_TRUE(CNPJUtil::ExtractDigits("11.222.333/0001-81", &digits));
  EXPECT_EQ(digits, "11222333000181");
  EXPECT_TRUE(CNPJUtil::ExtractDigits("  CNPJ: 12 345 678 0001 95 ", &digits));
  EXPECT_EQ(digits, "12345678000195");
}

TEST(CNPJUtilTest, ExtractDigitsRejectsBadInput) {
  std::string digits = "garbage";
  EXPECT_FALSE(CNPJUtil::ExtractDigits("11.222.333/0001-82", &digits));
  EXPECT_EQ(digits, "");
  EXPECT_FALSE(CNPJUtil::ExtractDigits("11222333000181 11222333000181", &digits));
  EXPECT_EQ(digits, "");
  EXPECT_FALSE(CNPJUtil::ExtractDigits("no digits here", &digits));
}

TEST(CNPJUtilTest, Mask) {
  EXPECT_EQ(CNPJUtil::Mask("11222333000181"), "11.222.333/0001-81");
}

TEST(CNPJTest, PartsAndRendering) {
  CNPJ cnpj = CNPJ::FromParts(11222333, 1);
  EXPECT_EQ(cnpj.base12(), 112223330001LL);
  EXPECT_EQ(cnpj.root(), 11222333);
  EXPECT_EQ(cnpj.branch(), 1);
  EXPECT_EQ(cnpj.first_check_digit(), 8);
  EXPECT_EQ(cnpj.second_check_digit(), 1);
  EXPECT_EQ(cnpj.Digits(), "11222333000181");
  EXPECT_EQ(cnpj.Masked(), "11.222.333/0001-81");
}

TEST(CNPJTest, SmallBasesAreZeroPadded) {
  EXPECT_EQ(CNPJ::FromBase12(1).Digits(), "00000000000191");
  EXPECT_EQ(CNPJ::FromBase12(0).Digits(), "00000000000000");
}
