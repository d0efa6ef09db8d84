#ifndef CNPJ_FORGE_CNPJ_PROGRESS_REPORTER_H_
#define CNPJ_FORGE_CNPJ_PROGRESS_REPORTER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ostream>
#include <thread>

#include "CNPJChunkedWriter.hpp"

// Prints "... <count> generated" lines from its own thread. Report() only
// stores the latest count, so the generating thread never waits on the
// output stream.
class CNPJProgressReporter {
 public:
  explicit CNPJProgressReporter(std::ostream* out,
                                std::chrono::milliseconds period = std::chrono::milliseconds(200))
      : out_(out), period_(period) {}

  ~CNPJProgressReporter() { Stop(); }

  void Start() {
    if (worker_.joinable()) {
      return;
    }
    stop_requested_ = false;
    worker_ = std::thread([this] () -> void { Run(); });
  }

  void Report(int64_t count) { latest_.store(count, std::memory_order_relaxed); }

  // Joins the printing thread. The last reported count is always printed
  // before Stop() returns.
  void Stop() {
    stop_requested_ = true;
    if (worker_.joinable()) {
      worker_.join();
    } else {
      Print();
    }
  }

  CNPJChunkedWriter::ProgressFn Callback() {
    return [this] (int64_t count) -> void { Report(count); };
  }

 private:
  void Run() {
    while (!stop_requested_.load()) {
      Print();
      std::this_thread::sleep_for(period_);
    }
    Print();
  }

  void Print() {
    int64_t count = latest_.load(std::memory_order_relaxed);
    if (count > printed_) {
      *out_ << "... " << count << " generated" << std::endl;
      printed_ = count;
    }
  }

  std::ostream* out_;
  std::chrono::milliseconds period_;
  std::atomic<int64_t> latest_{0};
  std::atomic<bool> stop_requested_{false};
  // Only touched by whichever thread is printing.
  int64_t printed_ = 0;
  std::thread worker_;
};

#endif  // CNPJ_FORGE_CNPJ_PROGRESS_REPORTER_H_
