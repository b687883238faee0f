#include "app/StatisticsComposer.hpp"
#include "util/Normalize.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace modeminfo::app {

using namespace modeminfo::model;

const std::vector<std::string>& flattened_keys() {
  static const std::vector<std::string> keys{
    "timestamp",
    "down_signal_min",
    "down_signal_mean",
    "down_signal_max",
    "down_snr_min",
    "down_snr_mean",
    "down_snr_max",
    "down_plc_power",
    "down_octets_total",
    "down_correcteds_total",
    "down_uncorrectables_total",
    "up_signal_mean",
  };
  return keys;
}

std::string iso8601_local(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  long off = tm.tm_gmtoff; // seconds east of UTC
  char sign = off < 0 ? '-' : '+';
  off = std::labs(off);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s%c%02ld:%02ld", date, sign, off / 3600, (off % 3600) / 60);
  return buf;
}

FlattenedStatistics compose_flattened(const std::optional<DocsisDownstreamFlattened>& downstream,
                                      const std::optional<DocsisDownstreamOfdmFlattened>& downstream_ofdm,
                                      const std::optional<DocsisUpstreamFlattened>& upstream,
                                      std::chrono::system_clock::time_point now) {
  // Absent aggregates read as all-zero through the accessors
  const DocsisDownstreamFlattened ds = downstream.value_or(DocsisDownstreamFlattened{});
  const DocsisDownstreamOfdmFlattened ofdm = downstream_ofdm.value_or(DocsisDownstreamOfdmFlattened{});
  const DocsisUpstreamFlattened us = upstream.value_or(DocsisUpstreamFlattened{});
  using util::format_fixed3;

  FlattenedStatistics row;
  row.reserve(flattened_keys().size());
  row.emplace_back("timestamp", iso8601_local(now));
  row.emplace_back("down_signal_min", format_fixed3(ds.signal_strength_min()));
  row.emplace_back("down_signal_mean", format_fixed3(ds.signal_strength_mean()));
  row.emplace_back("down_signal_max", format_fixed3(ds.signal_strength_max()));
  row.emplace_back("down_snr_min", format_fixed3(ds.snr_min()));
  row.emplace_back("down_snr_mean", format_fixed3(ds.snr_mean()));
  row.emplace_back("down_snr_max", format_fixed3(ds.snr_max()));
  row.emplace_back("down_plc_power", format_fixed3(ofdm.plc_power_mean()));
  row.emplace_back("down_octets_total", ofdm.octets_total());
  row.emplace_back("down_correcteds_total", ofdm.corrected_total());
  row.emplace_back("down_uncorrectables_total", ofdm.uncorrected_total());
  row.emplace_back("up_signal_mean", format_fixed3(us.signal_strength_mean()));
  return row;
}

std::string flat_value_text(const FlatValue& v) {
  if (const auto* s = std::get_if<std::string>(&v)) return *s;
  return std::to_string(std::get<int64_t>(v));
}

nlohmann::ordered_json to_json(const FlattenedStatistics& row) {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (const auto& [k, v] : row) {
    if (const auto* s = std::get_if<std::string>(&v)) j[k] = *s;
    else j[k] = std::get<int64_t>(v);
  }
  return j;
}

} // namespace modeminfo::app
