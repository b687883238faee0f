#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <thread>
#include "app/CsvWriter.hpp"
#include "app/JsonlWriter.hpp"
#include "collectors/IModemDriver.hpp"

namespace modeminfo::app {

// Drives the enabled writers on a fixed cadence from a background thread.
// A failing step (transport, schema or I/O) is logged and the loop
// carries on with the next step and the next poll.
class Poller {
public:
  Poller(collectors::IDocsisModemDriver& driver,
         std::unique_ptr<CsvWriter> csv,
         std::unique_ptr<JsonlWriter> jsonl,
         std::chrono::milliseconds interval = std::chrono::milliseconds(60000));
  ~Poller();
  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  void start();
  void stop();

  // Run every enabled step once on the calling thread. Returns the
  // number of steps that failed.
  int poll_once();

  [[nodiscard]] uint64_t polls() const { return polls_.load(std::memory_order_relaxed); }
  [[nodiscard]] uint64_t failures() const { return failures_.load(std::memory_order_relaxed); }

private:
  void run(std::stop_token st);
  template <class Fn> bool step(const char* what, Fn&& fn);

  collectors::IDocsisModemDriver& driver_;
  std::unique_ptr<CsvWriter> csv_;
  std::unique_ptr<JsonlWriter> jsonl_;
  std::chrono::milliseconds interval_;
  std::atomic<uint64_t> polls_{0};
  std::atomic<uint64_t> failures_{0};
  std::jthread thread_{};
};

} // namespace modeminfo::app
