#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "CNPJConfig.hpp"
#include "CNPJForgeClient.hpp"

using namespace std::chrono;

void PrintUsage() {
  std::cerr << "Usage: ./cli server_address validate [quiet|time]" << std::endl
            << "       ./cli server_address generate config_file" << std::endl;
}

// Reads identifiers from stdin, one per line, and prints "<normalized> true"
// or "<input> false" for each.
int RunValidate(CNPJForgeClient* client, bool quiet, bool time) {
  std::ios::sync_with_stdio(false);
  std::string line;
  int line_count = 0, invalid_count = 0;
  auto start = high_resolution_clock::now();
  while (std::getline(std::cin, line)) {
    ValidateResponse response;
    if (!client->Validate(line, &response)) {
      return 1;
    }
    ++line_count;
    if (!response.valid()) ++invalid_count;
    if (quiet) continue;
    std::cout << (response.valid() ? response.normalized() : line) << " "
              << (response.valid() ? "true" : "false") << std::endl;
  }
  if (line_count == 0) return 1;
  auto stop = high_resolution_clock::now();
  auto duration_ms = duration_cast<milliseconds>(stop - start);
  if (time) {
    std::cout << "Took " << duration_ms.count() << "ms." << std::endl;
    std::cout << "Average request duration: "
              << duration_ms.count() / line_count << "ms." << std::endl;
  }
  return invalid_count == 0 ? 0 : 1;
}

int RunGenerate(CNPJForgeClient* client, const std::string& config_file) {
  GenerationConfig config;
  Status status = CNPJConfig::LoadFromFile(config_file, &config);
  if (!status.ok()) {
    std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
    return 1;
  }
  status = client->Generate(config, [] (const std::string& identifier) -> void {
    std::cout << identifier << "\n";
  });
  std::cout.flush();
  if (!status.ok()) {
    std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
    return CNPJStatus::IsExhaustionError(status) ? 3 : 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 3 || argc > 4) {
    PrintUsage();
    exit(1);
  }

  std::string target(argv[1]);
  std::string action(argv[2]);
  auto client = CNPJForgeClient::New(target);

  if (action == "validate") {
    bool quiet = false, time = false;
    if (argc == 4) {
      if (strcmp(argv[3], "quiet") == 0) {
        quiet = true;
      } else if (strcmp(argv[3], "time") == 0) {
        time = true;
      } else {
        PrintUsage();
        exit(1);
      }
    }
    return RunValidate(client.get(), quiet, time);
  }
  if (action == "generate" && argc == 4) {
    return RunGenerate(client.get(), argv[3]);
  }

  std::cerr << "Unknown action \"" << action << "\"." << std::endl;
  PrintUsage();
  return 1;
}
