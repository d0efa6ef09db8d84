#ifndef CNPJ_FORGE_CNPJ_FORGE_CLIENT_H_
#define CNPJ_FORGE_CNPJ_FORGE_CLIENT_H_

#include <grpcpp/grpcpp.h>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "cnpjforge.grpc.pb.h"

using grpc::Channel;
using grpc::ClientContext;
using grpc::ClientReader;
using grpc::Status;

using cnpjforge::CNPJForge;
using cnpjforge::GeneratedIdentifier;
using cnpjforge::GenerationConfig;
using cnpjforge::ValidateRequest;
using cnpjforge::ValidateResponse;

class CNPJForgeClient {
 public:
  // Returns false on an RPC failure, *response is only meaningful on success.
  bool Validate(const std::string& identifier, ValidateResponse* response) {
    ValidateRequest request;
    request.set_identifier(identifier);
    ClientContext context;
    Status status = stub_->Validate(&context, request, response);
    if (!status.ok()) {
      std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
      return false;
    }
    return true;
  }

  // Calls on_identifier for every streamed identifier and returns the final
  // status of the run (RESOURCE_EXHAUSTED for a short run).
  Status Generate(const GenerationConfig& config,
                  std::function<void(const std::string&)> on_identifier) {
    ClientContext context;
    std::unique_ptr<ClientReader<GeneratedIdentifier>> reader(
        stub_->Generate(&context, config));
    GeneratedIdentifier identifier;
    while (reader->Read(&identifier)) {
      on_identifier(identifier.identifier());
    }
    return reader->Finish();
  }

  static std::unique_ptr<CNPJForgeClient> New(const std::string& target) {
    auto insecure_credentials = grpc::InsecureChannelCredentials();
    auto grpc_channel = grpc::CreateChannel(target, insecure_credentials);
    return New(grpc_channel);
  }

  static std::unique_ptr<CNPJForgeClient> New(std::shared_ptr<Channel> channel) {
    return std::unique_ptr<CNPJForgeClient>(new CNPJForgeClient(channel));
  }

 private:
  CNPJForgeClient(std::shared_ptr<Channel> channel)
      : stub_(CNPJForge::NewStub(channel)) {}

  std::unique_ptr<CNPJForge::Stub> stub_;
};

#endif  // CNPJ_FORGE_CNPJ_FORGE_CLIENT_H_
