// Test utility: print progress dots to stderr while a long stress test runs.
#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <thread>

namespace stackscope::testutil {

class Heartbeat {
 public:
  explicit Heartbeat(const char* label = nullptr,
                     std::chrono::milliseconds period = std::chrono::milliseconds(500))
      : period_(period) {
    if (label != nullptr) { std::fprintf(stderr, "[stackscope-test] %s ", label); }
    std::fflush(stderr);
    thr_ = std::thread([this]() { run(); });
  }
  ~Heartbeat() {
    running_.store(false, std::memory_order_release);
    if (thr_.joinable()) { thr_.join(); }
    std::fprintf(stderr, " (%u beats)\n", beats_);
    std::fflush(stderr);
  }

  Heartbeat(const Heartbeat&) = delete;
  Heartbeat& operator=(const Heartbeat&) = delete;

 private:
  void run() {
    while (running_.load(std::memory_order_acquire)) {
      std::fputc('.', stderr);
      std::fflush(stderr);
      ++beats_;
      std::this_thread::sleep_for(period_);
    }
  }

  std::atomic<bool> running_{true};
  std::chrono::milliseconds period_;
  unsigned beats_{0};
  std::thread thr_;
};

} // namespace stackscope::testutil
