#ifndef CNPJ_FORGE_CNPJ_GENERATOR_H_
#define CNPJ_FORGE_CNPJ_GENERATOR_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

#include <grpcpp/support/status.h>

#include "CNPJ.hpp"
#include "CNPJChunkedWriter.hpp"
#include "CNPJStatus.hpp"
#include "CNPJStrategy.hpp"

// Pulls identifiers out of a strategy and hands them to a sink until the
// strategy is done, the sink fails or a stop is requested.
class CNPJGenerator {
 public:
  typedef std::function<grpc::Status(const CNPJ&)> SinkFn;
  typedef std::function<bool()> StopFn;

  // Returns:
  //   * OK when the strategy delivered everything it was asked for.
  //   * RESOURCE_EXHAUSTED when a bounded strategy ran dry before its target.
  //   * CANCELLED when should_stop() turned true.
  //   * whatever the sink returned if it failed.
  // *produced always holds the number of identifiers the sink accepted.
  static grpc::Status Drain(CNPJStrategy* strategy, SinkFn sink, StopFn should_stop,
                            int64_t* produced) {
    *produced = 0;
    CNPJ cnpj;
    while (true) {
      if (should_stop && should_stop()) {
        return CNPJStatus::Cancelled("stopped after " + std::to_string(*produced) +
                                     " identifiers");
      }
      if (!strategy->Next(&cnpj)) {
        break;
      }
      grpc::Status status = sink(cnpj);
      if (!status.ok()) {
        return status;
      }
      ++(*produced);
    }

    int64_t target = strategy->Target();
    if (target != CNPJStrategy::kUnbounded && *produced < target) {
      return CNPJStatus::ExhaustionError(
          strategy->Name() + " space exhausted: produced " +
          std::to_string(*produced) + " of " + std::to_string(target) +
          " requested identifiers");
    }
    return grpc::Status::OK;
  }

  // Runs a strategy into an already opened writer and closes it on every
  // path, so the files on disk end with a complete line whatever happened.
  static grpc::Status Run(CNPJStrategy* strategy, CNPJChunkedWriter* writer,
                          const std::atomic<bool>* stop, int64_t* produced) {
    grpc::Status status = Drain(
        strategy,
        [writer] (const CNPJ& cnpj) -> grpc::Status { return writer->Write(cnpj); },
        [stop] () -> bool { return stop != nullptr && stop->load(); },
        produced);
    grpc::Status close_status = writer->Close();
    if (status.ok() || CNPJStatus::IsExhaustionError(status) ||
        status.error_code() == grpc::StatusCode::CANCELLED) {
      // A failing close loses data, which outranks the other outcomes.
      if (!close_status.ok()) {
        return close_status;
      }
    }
    return status;
  }
};

#endif  // CNPJ_FORGE_CNPJ_GENERATOR_H_
