#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <signal.h>

#include "CNPJChunkedWriter.hpp"
#include "CNPJConfig.hpp"
#include "CNPJGenerator.hpp"
#include "CNPJProgressReporter.hpp"
#include "CNPJStatus.hpp"
#include "CNPJStrategy.hpp"

std::atomic<bool> stop_requested(false);

void SigIntHandler(int s) {
  stop_requested = true;
}

void SetUpSigIntHandler() {
  struct sigaction sig_int_handler;
  sig_int_handler.sa_handler = SigIntHandler;
  sigemptyset(&sig_int_handler.sa_mask);
  sig_int_handler.sa_flags = 0;
  sigaction(SIGINT, &sig_int_handler, nullptr);
}

void PrintUsage() {
  std::cout << "Usage: ./cnpj-gen config_file" << std::endl;
}

int ExitCode(const grpc::Status& status) {
  if (status.ok()) return 0;
  if (CNPJStatus::IsConfigurationError(status)) return 1;
  if (CNPJStatus::IsIOError(status)) return 2;
  if (CNPJStatus::IsExhaustionError(status)) return 3;
  if (status.error_code() == grpc::StatusCode::CANCELLED) return 130;
  return 1;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc != 2) {
    PrintUsage();
    exit(1);
  }

  GenerationConfig config;
  grpc::Status status = CNPJConfig::LoadFromFile(argv[1], &config);
  std::unique_ptr<CNPJStrategy> strategy;
  if (status.ok()) {
    status = CNPJConfig::NewStrategy(config, &strategy);
  }
  if (!status.ok()) {
    std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
    return ExitCode(status);
  }

  CNPJProgressReporter reporter(&std::cerr);
  CNPJChunkedWriter writer(config.output().progress_every(), reporter.Callback());
  status = writer.Open(CNPJConfig::OutputPrefix(config), config.output().chunk_size(),
                       config.output().masked());
  if (!status.ok()) {
    std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
    return ExitCode(status);
  }

  SetUpSigIntHandler();
  reporter.Start();
  int64_t produced = 0;
  status = CNPJGenerator::Run(strategy.get(), &writer, &stop_requested, &produced);
  reporter.Stop();
  if (!status.ok()) {
    std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
  }

  std::cout << "Wrote " << produced << " identifiers (" << strategy->Name() << ") to "
            << writer.files().size() << " file(s)." << std::endl;
  for (const std::string& path : writer.files()) {
    std::cout << "  " << path << std::endl;
  }
  return ExitCode(status);
}
