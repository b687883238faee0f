#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace modeminfo::model {

// Statistics of one numeric field over the channels that reported it.
// Only built from a non-empty set, so count >= 1.
template <class T>
struct FieldStats {
  size_t count{};
  T min{};
  double mean{};
  T max{};
  T total{};
};

struct DocsisDownstreamFlattened {
  int64_t timestamp{};
  size_t num_channels{};
  std::optional<FieldStats<double>>  signal_strength;
  std::optional<FieldStats<double>>  snr;
  std::optional<FieldStats<int64_t>> octets;
  std::optional<FieldStats<int64_t>> corrected;
  std::optional<FieldStats<int64_t>> uncorrected;

  double signal_strength_min() const { return signal_strength ? signal_strength->min : 0.0; }
  double signal_strength_mean() const { return signal_strength ? signal_strength->mean : 0.0; }
  double signal_strength_max() const { return signal_strength ? signal_strength->max : 0.0; }
  double snr_min() const { return snr ? snr->min : 0.0; }
  double snr_mean() const { return snr ? snr->mean : 0.0; }
  double snr_max() const { return snr ? snr->max : 0.0; }
  int64_t octets_total() const { return octets ? octets->total : 0; }
  int64_t corrected_total() const { return corrected ? corrected->total : 0; }
  int64_t corrected_min() const { return corrected ? corrected->min : 0; }
  int64_t corrected_mean() const { return corrected ? corrected->total / static_cast<int64_t>(corrected->count) : 0; }
  int64_t corrected_max() const { return corrected ? corrected->max : 0; }
  int64_t uncorrected_total() const { return uncorrected ? uncorrected->total : 0; }
  int64_t uncorrected_min() const { return uncorrected ? uncorrected->min : 0; }
  int64_t uncorrected_mean() const { return uncorrected ? uncorrected->total / static_cast<int64_t>(uncorrected->count) : 0; }
  int64_t uncorrected_max() const { return uncorrected ? uncorrected->max : 0; }
};

struct DocsisDownstreamOfdmFlattened {
  int64_t timestamp{};
  size_t num_channels{};
  std::optional<FieldStats<double>>  plc_power;
  std::optional<FieldStats<double>>  snr;
  std::optional<FieldStats<int64_t>> octets;
  std::optional<FieldStats<int64_t>> corrected;
  std::optional<FieldStats<int64_t>> uncorrected;

  double plc_power_min() const { return plc_power ? plc_power->min : 0.0; }
  double plc_power_mean() const { return plc_power ? plc_power->mean : 0.0; }
  double plc_power_max() const { return plc_power ? plc_power->max : 0.0; }
  double snr_min() const { return snr ? snr->min : 0.0; }
  double snr_mean() const { return snr ? snr->mean : 0.0; }
  double snr_max() const { return snr ? snr->max : 0.0; }
  int64_t octets_total() const { return octets ? octets->total : 0; }
  int64_t corrected_total() const { return corrected ? corrected->total : 0; }
  int64_t corrected_min() const { return corrected ? corrected->min : 0; }
  int64_t corrected_mean() const { return corrected ? corrected->total / static_cast<int64_t>(corrected->count) : 0; }
  int64_t corrected_max() const { return corrected ? corrected->max : 0; }
  int64_t uncorrected_total() const { return uncorrected ? uncorrected->total : 0; }
  int64_t uncorrected_min() const { return uncorrected ? uncorrected->min : 0; }
  int64_t uncorrected_mean() const { return uncorrected ? uncorrected->total / static_cast<int64_t>(uncorrected->count) : 0; }
  int64_t uncorrected_max() const { return uncorrected ? uncorrected->max : 0; }
};

struct DocsisUpstreamFlattened {
  int64_t timestamp{};
  size_t num_channels{};
  std::optional<FieldStats<double>> signal_strength;

  double signal_strength_min() const { return signal_strength ? signal_strength->min : 0.0; }
  double signal_strength_mean() const { return signal_strength ? signal_strength->mean : 0.0; }
  double signal_strength_max() const { return signal_strength ? signal_strength->max : 0.0; }
};

struct DocsisUpstreamOfdmFlattened {
  int64_t timestamp{};
  size_t num_channels{};
  std::optional<FieldStats<double>> line_digital_attenuation;
  std::optional<FieldStats<double>> digital_attenuation;
  std::optional<FieldStats<double>> report_power;
  std::optional<FieldStats<double>> report_power1_6;

  double line_digital_attenuation_min() const { return line_digital_attenuation ? line_digital_attenuation->min : 0.0; }
  double line_digital_attenuation_mean() const { return line_digital_attenuation ? line_digital_attenuation->mean : 0.0; }
  double line_digital_attenuation_max() const { return line_digital_attenuation ? line_digital_attenuation->max : 0.0; }
  double digital_attenuation_min() const { return digital_attenuation ? digital_attenuation->min : 0.0; }
  double digital_attenuation_mean() const { return digital_attenuation ? digital_attenuation->mean : 0.0; }
  double digital_attenuation_max() const { return digital_attenuation ? digital_attenuation->max : 0.0; }
  double report_power_min() const { return report_power ? report_power->min : 0.0; }
  double report_power_mean() const { return report_power ? report_power->mean : 0.0; }
  double report_power_max() const { return report_power ? report_power->max : 0.0; }
  double report_power1_6_min() const { return report_power1_6 ? report_power1_6->min : 0.0; }
  double report_power1_6_mean() const { return report_power1_6 ? report_power1_6->mean : 0.0; }
  double report_power1_6_max() const { return report_power1_6 ? report_power1_6->max : 0.0; }
};

// One display/storage row per poll. Key order is fixed so CSV headers
// never shift between rows.
using FlatValue = std::variant<std::string, int64_t>;
using FlattenedStatistics = std::vector<std::pair<std::string, FlatValue>>;

} // namespace modeminfo::model
