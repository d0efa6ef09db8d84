#ifndef CNPJ_FORGE_CNPJ_STATUS_H_
#define CNPJ_FORGE_CNPJ_STATUS_H_

#include <string>

#include <grpcpp/support/status.h>

// Engine errors are plain grpc::Status values so that the generation service
// can hand them to clients untouched.
//   * INVALID_ARGUMENT: bad or contradictory configuration, nothing written.
//   * RESOURCE_EXHAUSTED: the strategy ran out of space, output is short.
//   * DATA_LOSS: an output file could not be opened or written.
//   * CANCELLED: a stop was requested, output is complete up to that point.
class CNPJStatus {
 public:
  static grpc::Status ConfigurationError(const std::string& message) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
  }

  static grpc::Status ExhaustionError(const std::string& message) {
    return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, message);
  }

  static grpc::Status IOError(const std::string& message) {
    return grpc::Status(grpc::StatusCode::DATA_LOSS, message);
  }

  static grpc::Status Cancelled(const std::string& message) {
    return grpc::Status(grpc::StatusCode::CANCELLED, message);
  }

  static bool IsConfigurationError(const grpc::Status& status) {
    return status.error_code() == grpc::StatusCode::INVALID_ARGUMENT;
  }

  static bool IsExhaustionError(const grpc::Status& status) {
    return status.error_code() == grpc::StatusCode::RESOURCE_EXHAUSTED;
  }

  static bool IsIOError(const grpc::Status& status) {
    return status.error_code() == grpc::StatusCode::DATA_LOSS;
  }
};

#endif  // CNPJ_FORGE_CNPJ_STATUS_H_
