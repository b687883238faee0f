#include "app/Config.hpp"
#include "app/CsvWriter.hpp"
#include "app/JsonlWriter.hpp"
#include "app/Poller.hpp"
#include "app/StatisticsComposer.hpp"
#include "collectors/HitronCoda45.hpp"
#include "collectors/HttpTransport.hpp"
#include "collectors/ReplayTransport.hpp"
#include "util/Normalize.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#ifndef MODEMINFO_VERSION
#define MODEMINFO_VERSION "0.0.0"
#endif

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_sigint(int){ g_stop.store(true); }

static void print_usage(std::ostream& os) {
  os << "Usage: modem-info [-h|--help] [-v|--version] COMMAND [ARGS]...\n"
        "\n"
        "  Collect detailed information and statistics from your modem.\n"
        "\n"
        "Commands:\n"
        "  get ADDRESS [-p PATH] [-i SECONDS] [-c|--csv] [-j|--json] [--once]\n";
}

static void print_get_help() {
  std::cout << "Usage: modem-info get [OPTIONS] ADDRESS\n"
               "\n"
               "  Get detailed information and statistics from a modem at ADDRESS.\n"
               "\n"
               "Options:\n"
               "  -p, --path PATH         Path to output files.  [default: data]\n"
               "  -i, --interval SECONDS  Interval to record data on (>= 5).  [default: 60]\n"
               "  -c, --csv               Write DOCSIS statistics to CSV.\n"
               "  -j, --json              Write DOCSIS statistics to JSONL.\n"
               "      --once              Poll once and exit.\n"
               "  -h, --help              Show this message and exit.\n";
}

// "[2026-10-18T09:30:00-07:00] msg", the way progress lines are stamped
static void log_line(std::ostream& os, const std::string& msg) {
  os << '[' << modeminfo::app::iso8601_local(std::chrono::system_clock::now()) << "] " << msg << '\n';
  os.flush();
}

static void error_line(const std::string& msg) {
  log_line(std::cerr, "ERROR: " + msg);
}

static bool parse_seconds(const std::string& s, double& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

static int run_get(int argc, char** argv, int first) {
  auto cfg = modeminfo::app::load_config();
  bool once = false;
  for (int i = first; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-p" || a == "--path") && i + 1 < argc) cfg.output_path = argv[++i];
    else if ((a == "-i" || a == "--interval") && i + 1 < argc) {
      std::string v = argv[++i];
      double secs = 0.0;
      if (!parse_seconds(v, secs) || secs < modeminfo::app::kMinIntervalSeconds) {
        error_line("invalid value for '-i' / '--interval': " + v + " is not >= 5");
        return 2;
      }
      cfg.interval_s = secs;
    }
    else if (a == "-c" || a == "--csv") cfg.csv = true;
    else if (a == "-j" || a == "--json") cfg.jsonl = true;
    else if (a == "--once") once = true;
    else if (a == "-h" || a == "--help") { print_get_help(); return 0; }
    else if (!a.empty() && a[0] == '-') { error_line("no such option: " + a); return 2; }
    else cfg.address = a;
  }

  if (cfg.address.empty()) { error_line("missing argument 'ADDRESS'"); return 2; }
  auto address = modeminfo::util::to_ip_address(cfg.address);
  if (!address) { error_line("'" + cfg.address + "' is not a valid IP address"); return 2; }
  if (!cfg.csv && !cfg.jsonl) {
    error_line("Must select at least one output format: --csv, --json");
    return 2;
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(cfg.output_path, ec)) {
    error_line("directory '" + cfg.output_path + "' does not exist");
    return 2;
  }

  std::unique_ptr<modeminfo::collectors::ITransport> transport;
  try {
    if (!cfg.replay_root.empty()) {
      transport = std::make_unique<modeminfo::collectors::ReplayTransport>(cfg.replay_root);
    } else {
      transport = std::make_unique<modeminfo::collectors::HttpTransport>(
          *address, cfg.scheme, std::chrono::milliseconds(cfg.timeout_ms));
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "modem-info: %s\n", e.what());
    error_line("Unable to connect to modem at " + address->str());
    return 1;
  }
  modeminfo::collectors::HitronCoda45 modem(*address, std::move(transport));

  const std::string addr_text = address->str();
  std::unique_ptr<modeminfo::app::CsvWriter> csv;
  std::unique_ptr<modeminfo::app::JsonlWriter> jsonl;
  if (cfg.csv) {
    csv = std::make_unique<modeminfo::app::CsvWriter>(cfg.output_path, addr_text);
    log_line(std::cout, "Beginning CSV output to " + cfg.output_path);
  }
  if (cfg.jsonl) {
    jsonl = std::make_unique<modeminfo::app::JsonlWriter>(cfg.output_path, addr_text);
    log_line(std::cout, "Beginning JSONL output to " + cfg.output_path);
  }

  auto interval = std::chrono::milliseconds(static_cast<long long>(cfg.interval_s * 1000.0));
  modeminfo::app::Poller poller(modem, std::move(csv), std::move(jsonl), interval);
  if (once) return poller.poll_once() == 0 ? 0 : 1;

  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);
  poller.start();
  while (!g_stop.load()) std::this_thread::sleep_for(100ms);
  poller.stop();
  log_line(std::cout, "Aborted by user");
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) { print_usage(std::cerr); return 2; }
  std::string cmd = argv[1];
  if (cmd == "-h" || cmd == "--help") { print_usage(std::cout); return 0; }
  if (cmd == "-v" || cmd == "--version") {
    std::cout << "modem-info v" << MODEMINFO_VERSION << " -- Copyright (c) 2025 Ryan Kozak\n";
    return 0;
  }
  if (cmd == "get") return run_get(argc, argv, 2);
  error_line("no such command '" + cmd + "'");
  print_usage(std::cerr);
  return 2;
}
