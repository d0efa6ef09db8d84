#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "CNPJUtil.hpp"

void PrintUsage() {
  std::cout << "Usage: ./cnpj-check < identifiers_file" << std::endl;
}

// Prints "<normalized> true" or "<line> false" per input line. Masks and any
// other punctuation are ignored. Exits with 1 if at least one line was
// invalid.
int main(int argc, char** argv) {
  if (argc != 1) {
    PrintUsage();
    exit(1);
  }

  std::ios::sync_with_stdio(false);
  std::string line, digits;
  int64_t line_count = 0, invalid_count = 0;
  while (std::getline(std::cin, line)) {
    if (line.empty()) continue;
    ++line_count;
    if (CNPJUtil::ExtractDigits(line, &digits)) {
      std::cout << digits << " true\n";
    } else {
      std::cout << line << " false\n";
      ++invalid_count;
    }
  }
  std::cout.flush();
  std::cerr << "Checked " << line_count << " lines, " << invalid_count
            << " invalid." << std::endl;
  return invalid_count == 0 ? 0 : 1;
}
