#ifndef CNPJ_FORGE_CNPJ_FORGE_SERVICE_IMPL_H_
#define CNPJ_FORGE_CNPJ_FORGE_SERVICE_IMPL_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "cnpjforge.grpc.pb.h"

#include "CNPJConfig.hpp"
#include "CNPJGenerator.hpp"
#include "CNPJStrategy.hpp"
#include "CNPJUtil.hpp"

using grpc::ServerContext;
using grpc::ServerWriter;
using grpc::Status;

using cnpjforge::CNPJForge;
using cnpjforge::GeneratedIdentifier;
using cnpjforge::ValidateRequest;
using cnpjforge::ValidateResponse;

class CNPJForgeServiceImpl final : public CNPJForge::Service {
 public:
  Status Validate(ServerContext* context, const ValidateRequest* request,
                  ValidateResponse* response) override {
    std::string digits;
    bool valid = CNPJUtil::ExtractDigits(request->identifier(), &digits);
    response->set_valid(valid);
    if (valid) {
      response->set_normalized(digits);
      response->set_masked(CNPJUtil::Mask(digits));
    }
    return Status::OK;
  }

  // Streams the whole run back. A client that goes away cancels the context,
  // which stops the strategy before the next identifier is pulled.
  Status Generate(ServerContext* context, const GenerationConfig* request,
                  ServerWriter<GeneratedIdentifier>* writer) override {
    std::unique_ptr<CNPJStrategy> strategy;
    Status status = CNPJConfig::NewStrategy(*request, &strategy);
    if (!status.ok()) {
      Log("Generate rejected: " + status.error_message());
      return status;
    }
    Log("Generate " + strategy->Name());

    bool masked = request->output().masked();
    int64_t produced = 0;
    status = CNPJGenerator::Drain(
        strategy.get(),
        [writer, masked] (const CNPJ& cnpj) -> Status {
          GeneratedIdentifier identifier;
          identifier.set_identifier(masked ? cnpj.Masked() : cnpj.Digits());
          if (!writer->Write(identifier)) {
            return CNPJStatus::Cancelled("client stream closed");
          }
          return Status::OK;
        },
        [context] () -> bool { return context->IsCancelled(); },
        &produced);
    Log("Generate " + strategy->Name() + " done, " + std::to_string(produced) +
        " identifiers");
    return status;
  }

  // Blocks until *stop turns true, then shuts the server down and waits for
  // it to drain. *stop may be set from a signal handler.
  static void ServeUntil(grpc::Server* server, const std::atomic<bool>* stop,
                         std::chrono::milliseconds poll = std::chrono::milliseconds(100)) {
    std::thread t([server] () -> void { server->Wait(); });
    while (!stop->load()) {
      std::this_thread::sleep_for(poll);
    }
    server->Shutdown();
    t.join();
  }

 private:
  void Log(const std::string& line) {
    cout_mutex.lock();
    std::cout << line << std::endl;
    cout_mutex.unlock();
  }

  std::mutex cout_mutex;
};

#endif  // CNPJ_FORGE_CNPJ_FORGE_SERVICE_IMPL_H_
