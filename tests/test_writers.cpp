#include "minitest.hpp"
#include "app/CsvWriter.hpp"
#include "app/JsonlWriter.hpp"
#include "app/Poller.hpp"
#include "app/StatisticsComposer.hpp"
#include "collectors/HitronCoda45.hpp"
#include "util/Files.hpp"
#include "util/Normalize.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <thread>
#include <unistd.h>

using namespace modeminfo::app;
using namespace modeminfo::model;
namespace fs = std::filesystem;

static fs::path test_dir(const char* suffix) {
  auto dir = fs::temp_directory_path() /
             ("modeminfo_writer_test_" + std::to_string(::getpid()) + "_" + suffix);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static std::vector<std::string> lines_of(const fs::path& p) {
  std::ifstream in(p);
  std::vector<std::string> out;
  for (std::string line; std::getline(in, line);) out.push_back(line);
  return out;
}

TEST(csv_header_written_once) {
  auto dir = test_dir("csv");
  CsvWriter w(dir, "192.168.100.1");
  ASSERT_EQ(w.path(), dir / "192.168.100.1.csv");
  auto now = std::chrono::system_clock::from_time_t(1760800000);
  w.write(compose_flattened(std::nullopt, std::nullopt, std::nullopt, now));
  w.write(compose_flattened(std::nullopt, std::nullopt, std::nullopt, now));

  auto lines = lines_of(w.path());
  ASSERT_EQ(lines.size(), 3u);
  ASSERT_EQ(lines[0], std::string("timestamp,down_signal_min,down_signal_mean,down_signal_max,"
                                  "down_snr_min,down_snr_mean,down_snr_max,down_plc_power,"
                                  "down_octets_total,down_correcteds_total,down_uncorrectables_total,"
                                  "up_signal_mean"));
  ASSERT_TRUE(lines[1].ends_with(",0.000,0.000,0.000,0.000,0.000,0.000,0.000,0,0,0,0.000"));
  ASSERT_EQ(lines[1], lines[2]);

  // A new writer on an existing non-empty file appends without a header
  CsvWriter again(dir, "192.168.100.1");
  again.write(compose_flattened(std::nullopt, std::nullopt, std::nullopt, now));
  ASSERT_EQ(lines_of(w.path()).size(), 4u);
  fs::remove_all(dir);
}

TEST(csv_escape_rfc4180) {
  ASSERT_EQ(CsvWriter::escape("plain"), std::string("plain"));
  ASSERT_EQ(CsvWriter::escape("a,b"), std::string("\"a,b\""));
  ASSERT_EQ(CsvWriter::escape("say \"hi\""), std::string("\"say \"\"hi\"\"\""));
  ASSERT_EQ(CsvWriter::escape("two\nlines"), std::string("\"two\nlines\""));
}

TEST(csv_write_to_missing_directory_throws) {
  CsvWriter w("/nonexistent/modeminfo/dir", "10.0.0.1");
  bool threw = false;
  try { w.write(compose_flattened(std::nullopt, std::nullopt, std::nullopt)); }
  catch (const std::runtime_error&) { threw = true; }
  ASSERT_TRUE(threw);
}

TEST(jsonl_appends_one_document_per_line) {
  auto dir = test_dir("jsonl");
  JsonlWriter w(dir, "10.0.0.1");
  ASSERT_EQ(w.system_info_path(), dir / "10.0.0.1_system_info.jsonl");
  ASSERT_EQ(w.link_status_path(), dir / "10.0.0.1_link_status.jsonl");
  ASSERT_EQ(w.docsis_statistics_path(), dir / "10.0.0.1_docsis_statistics.jsonl");

  LinkStatus ls{};
  ls.timestamp = 99;
  LinkStatusData d{};
  d.status = true;
  d.speed = "1000Mbps";
  ls.data.push_back(d);
  w.write(ls);
  w.write(ls);

  DocsisStatistics s{};
  s.timestamp = 5;
  s.docsis_overview.lease_duration = std::chrono::seconds(3600);
  w.write(s);

  auto lines = lines_of(w.link_status_path());
  ASSERT_EQ(lines.size(), 2u);
  auto j = nlohmann::json::parse(lines[0]);
  ASSERT_EQ(j["timestamp"].get<int64_t>(), 99);
  ASSERT_EQ(j["data"][0]["status"].get<bool>(), true);
  ASSERT_EQ(j["data"][0]["speed"].get<std::string>(), std::string("1000Mbps"));
  ASSERT_TRUE(j["data"][0]["duplex"].is_null());

  auto stats = lines_of(w.docsis_statistics_path());
  ASSERT_EQ(stats.size(), 1u);
  auto js = nlohmann::json::parse(stats[0]);
  ASSERT_EQ(js["docsis_overview"]["lease_duration"].get<int64_t>(), 3600);
  ASSERT_TRUE(js["docsis_downstream"].is_array());
  ASSERT_TRUE(!fs::exists(w.system_info_path()));
  fs::remove_all(dir);
}

namespace {

// Serves fixed pages; every page missing from the map fails
class PageTransport : public modeminfo::collectors::ITransport {
public:
  explicit PageTransport(std::map<std::string, std::string> p) : pages_(std::move(p)) {}
  std::string fetch(const std::string& path) override {
    auto it = pages_.find(path);
    if (it == pages_.end()) throw modeminfo::collectors::TransportError(path, "unreachable");
    return it->second;
  }
  const char* name() const override { return "pages"; }
private:
  std::map<std::string, std::string> pages_;
};

} // namespace

TEST(poller_logs_failures_and_continues) {
  auto dir = test_dir("poller");
  auto addr = modeminfo::util::to_ip_address("10.0.0.9").value();
  // Only the link status page is served intact
  std::map<std::string, std::string> pages{
    {"/data/getLinkStatus.asp", R"([{"LinkStatus":"up"}])"},
    {"/data/getSysInfo.asp", R"({"not":"an array"})"},
  };
  modeminfo::collectors::HitronCoda45 modem(addr, std::make_unique<PageTransport>(pages));
  Poller poller(modem, std::make_unique<CsvWriter>(dir, addr.str()),
                std::make_unique<JsonlWriter>(dir, addr.str()));
  int failed = poller.poll_once();
  // csv (transport), system_info (schema), docsis_statistics (transport) fail; link_status succeeds
  ASSERT_EQ(failed, 3);
  ASSERT_EQ(poller.polls(), 1u);
  ASSERT_EQ(poller.failures(), 3u);
  ASSERT_EQ(lines_of(dir / "10.0.0.9_link_status.jsonl").size(), 1u);
  ASSERT_TRUE(!fs::exists(dir / "10.0.0.9.csv"));
  fs::remove_all(dir);
}

TEST(poller_thread_polls_and_stops) {
  auto dir = test_dir("poller_thread");
  auto addr = modeminfo::util::to_ip_address("10.0.0.8").value();
  std::map<std::string, std::string> pages{
    {"/data/dsinfo.asp", R"([{"portId":"1","signalStrength":"3.0"}])"},
    {"/data/dsofdminfo.asp", "[]"},
    {"/data/usinfo.asp", R"([{"portId":"1","signalStrength":"40.0"}])"},
  };
  modeminfo::collectors::HitronCoda45 modem(addr, std::make_unique<PageTransport>(pages));
  Poller poller(modem, std::make_unique<CsvWriter>(dir, addr.str()), nullptr,
                std::chrono::milliseconds(50));
  poller.start();
  auto t0 = std::chrono::steady_clock::now();
  while (poller.polls() < 2 && std::chrono::steady_clock::now() - t0 < std::chrono::seconds(3))
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  poller.stop();
  auto n = poller.polls();
  ASSERT_TRUE(n >= 2);
  ASSERT_EQ(poller.failures(), 0u);
  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  ASSERT_EQ(poller.polls(), n); // no polls after stop()
  auto lines = lines_of(dir / "10.0.0.8.csv");
  ASSERT_EQ(lines.size(), n + 1);
  ASSERT_TRUE(lines[1].find(",3.000,3.000,3.000,") != std::string::npos);
  fs::remove_all(dir);
}
