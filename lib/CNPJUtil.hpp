#ifndef CNPJ_FORGE_CNPJ_UTIL_H_
#define CNPJ_FORGE_CNPJ_UTIL_H_

#include <cctype>
#include <cstdint>
#include <iostream>
#include <string>

class CNPJUtil {
 public:
  static const int kBaseDigits = 12;
  static const int kDigits = 14;

  // Official modulo 11 check digit over the 12 digits of base12.
  static int FirstCheckDigit(int64_t base12) {
    static const int weights[12] = {5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
    return CheckDigit(base12, weights, 12);
  }

  // Same rule over base12 followed by the first check digit.
  static int SecondCheckDigit(int64_t base13) {
    static const int weights[13] = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
    return CheckDigit(base13, weights, 13);
  }

  static void ComputeCheckPair(int64_t base12, int* d1, int* d2) {
    *d1 = FirstCheckDigit(base12);
    *d2 = SecondCheckDigit(base12 * 10 + *d1);
  }

  // Checks whether the supplied cnpj (exactly 14 digits, no mask) is valid.
  static bool IsValid(const std::string& cnpj) {
    if (cnpj.size() != kDigits) {
      // Wrong length, a CNPJ is exactly 14 digits long.
      return false;
    }

    int64_t base12 = 0;
    for (size_t i = 0; i < cnpj.size(); ++i) {
      if (!isdigit(static_cast<unsigned char>(cnpj[i]))) {
        // Contains at least one non-digit character.
        return false;
      }
      if (i < kBaseDigits) {
        base12 = base12 * 10 + (cnpj[i] - '0');
      }
    }

    // Finally check both control digits.
    int d1, d2;
    ComputeCheckPair(base12, &d1, &d2);
    return d1 == cnpj[12] - '0' && d2 == cnpj[13] - '0';
  }

  // This function takes a string and converts it into the system canonical
  // representation (14 digits, no punctuation). The function returns true if
  // the digits found in the supplied string form a valid CNPJ, false
  // otherwise.
  static bool ExtractDigits(const std::string& cnpj_in, std::string* cnpj_out) {
    *cnpj_out = StripNonDigits(cnpj_in);
    if (cnpj_out->size() > kDigits) {
      // More than 14 digits probably means two identifiers glued together.
      std::cerr << "CNPJUtil::ExtractDigits encountered more than 14 digits in"
                << " the supplied string, this is probably not intended."
                << std::endl;
      *cnpj_out = "";
      return false;
    }

    bool is_valid = IsValid(*cnpj_out);
    if (!is_valid) {
      *cnpj_out = "";
    }
    return is_valid;
  }

  static std::string StripNonDigits(const std::string& s) {
    std::string digits;
    for (char c : s) {
      if (isdigit(static_cast<unsigned char>(c))) {
        digits += c;
      }
    }
    return digits;
  }

  // Renders 14 digits as DD.DDD.DDD/DDDD-DD.
  static std::string Mask(const std::string& digits) {
    return digits.substr(0, 2) + "." + digits.substr(2, 3) + "." +
           digits.substr(5, 3) + "/" + digits.substr(8, 4) + "-" +
           digits.substr(12, 2);
  }

 private:
  // Weights apply most significant digit first.
  static int CheckDigit(int64_t value, const int* weights, int count) {
    int sum = 0;
    for (int i = count - 1; i >= 0; --i) {
      sum += static_cast<int>(value % 10) * weights[i];
      value /= 10;
    }
    int remainder = sum % 11;
    return remainder < 2 ? 0 : 11 - remainder;
  }
};

#endif  // CNPJ_FORGE_CNPJ_UTIL_H_
