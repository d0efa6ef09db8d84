#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <signal.h>

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>

#include "CNPJForgeServiceImpl.hpp"

using grpc::Server;
using grpc::ServerBuilder;

std::atomic<bool> shutdown_requested(false);

void SigIntHandler(int s) {
  shutdown_requested = true;
}

void SetUpSigIntHandler() {
  struct sigaction sig_int_handler;
  sig_int_handler.sa_handler = SigIntHandler;
  sigemptyset(&sig_int_handler.sa_mask);
  sig_int_handler.sa_flags = 0;
  sigaction(SIGINT, &sig_int_handler, nullptr);
}

void PrintUsage() {
  std::cerr << "Usage: ./forge-server [listen_address]" << std::endl;
}

void RunServer(const std::string& server_address) {
  CNPJForgeServiceImpl service;
  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();
  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "Could not listen on " << server_address << std::endl;
    exit(1);
  }
  std::cout << "Server listening on " << server_address << std::endl;
  CNPJForgeServiceImpl::ServeUntil(server.get(), &shutdown_requested);
  std::cout << "Caught SIGINT." << std::endl;
}

int main(int argc, char** argv) {
  if (argc > 2) {
    PrintUsage();
    exit(1);
  }
  std::string server_address = argc == 2 ? argv[1] : "0.0.0.0:12000";
  SetUpSigIntHandler();
  RunServer(server_address);
  std::cout << "Bye." << std::endl;
  return 0;
}
