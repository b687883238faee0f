#include "app/Poller.hpp"
#include "collectors/ITransport.hpp"
#include "model/Reading.hpp"

#include <cstdio>
#include <exception>

using namespace std::chrono;

namespace modeminfo::app {

Poller::Poller(collectors::IDocsisModemDriver& driver,
               std::unique_ptr<CsvWriter> csv,
               std::unique_ptr<JsonlWriter> jsonl,
               milliseconds interval)
    : driver_(driver), csv_(std::move(csv)), jsonl_(std::move(jsonl)), interval_(interval) {}

Poller::~Poller() { stop(); }

void Poller::start() {
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Poller::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

template <class Fn>
bool Poller::step(const char* what, Fn&& fn) {
  try {
    fn();
    return true;
  } catch (const collectors::TransportError& e) {
    std::fprintf(stderr, "modem-info: Poller: %s: transport error on %s: %s\n",
                 what, e.path().c_str(), e.what());
  } catch (const model::SchemaMismatch& e) {
    std::fprintf(stderr, "modem-info: Poller: %s: unexpected payload: %s\n", what, e.what());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "modem-info: Poller: %s: %s\n", what, e.what());
  }
  failures_.fetch_add(1, std::memory_order_relaxed);
  return false;
}

int Poller::poll_once() {
  int failed = 0;
  if (csv_) {
    failed += !step("csv", [&]{ csv_->write(driver_.docsis_statistics_flattened()); });
  }
  if (jsonl_) {
    failed += !step("system_info", [&]{ jsonl_->write(driver_.system_info()); });
    failed += !step("link_status", [&]{ jsonl_->write(driver_.link_status()); });
    failed += !step("docsis_statistics", [&]{ jsonl_->write(driver_.docsis_statistics()); });
  }
  polls_.fetch_add(1, std::memory_order_relaxed);
  return failed;
}

void Poller::run(std::stop_token st) {
  std::fprintf(stderr, "modem-info: Poller: polling %s every %lldms\n",
               driver_.name(), static_cast<long long>(interval_.count()));
  auto next_due = steady_clock::now();
  while (!st.stop_requested()) {
    if (steady_clock::now() >= next_due) {
      poll_once();
      next_due += interval_;
      // Fell behind (slow modem): skip missed slots instead of bursting
      if (next_due < steady_clock::now()) next_due = steady_clock::now() + interval_;
    }
    // sleep until next_due, bounded so stop requests are noticed quickly
    auto nap = duration_cast<milliseconds>(next_due - steady_clock::now());
    if (nap < 1ms) nap = 1ms;
    if (nap > 100ms) nap = 100ms;
    std::this_thread::sleep_for(nap);
  }
}

} // namespace modeminfo::app
