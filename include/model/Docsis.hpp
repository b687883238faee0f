#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "model/Address.hpp"
#include "model/Reading.hpp"

namespace modeminfo::model {

// /data/getCMInit.asp
struct DocsisProvisioningData {
  bool hw_init{false};
  bool find_downstream{false};
  bool ranging{false};
  bool dhcp{false};
  bool time_of_day{false};
  bool download_config{false};
  bool registration{false};
  bool eae_status{false};
  std::string bpi_status;
  bool network_access{false};
  bool traffic_status{false};
  bool operator==(const DocsisProvisioningData&) const = default;
};

// /data/getCmDocsisWan.asp
struct DocsisOverviewData {
  std::string config_name;
  std::string config_name_display;
  bool network_access{false};
  std::optional<IpAddress> ip_address;
  std::optional<IpAddress> netmask;
  std::optional<IpAddress> gateway;
  std::chrono::seconds lease_duration{0};
  bool operator==(const DocsisOverviewData&) const = default;
};

// /data/dsinfo.asp, one SC-QAM downstream channel
struct DocsisDownstreamData {
  int64_t port_id{};
  std::optional<int64_t> frequency;  // Hz
  std::optional<int64_t> modulation;
  std::optional<double>  signal_strength; // dBmV
  std::optional<double>  snr;             // dB
  std::optional<int64_t> octets;
  std::optional<int64_t> corrected;
  std::optional<int64_t> uncorrected;
  std::optional<int64_t> channel_id;
  bool operator==(const DocsisDownstreamData&) const = default;
};

// /data/dsofdminfo.asp, one OFDM downstream receiver
struct DocsisDownstreamOfdmData {
  int64_t receiver{};
  std::optional<std::string> fft_type;
  std::optional<int64_t> subcarrier_0_frequency;
  bool plc_lock{false};
  bool ncp_lock{false};
  bool mdc1_lock{false};
  std::optional<double>  plc_power;
  std::optional<double>  snr;
  std::optional<int64_t> octets;
  std::optional<int64_t> corrected;
  std::optional<int64_t> uncorrected;
  bool operator==(const DocsisDownstreamOfdmData&) const = default;
};

// /data/usinfo.asp, one SC-QAM upstream channel
struct DocsisUpstreamData {
  int64_t port_id{};
  std::optional<int64_t> frequency;
  std::optional<int64_t> bandwidth;
  std::optional<std::string> modulation;
  std::optional<std::string> docsis_mode;
  std::optional<double>  signal_strength;
  std::optional<int64_t> channel_id;
  bool operator==(const DocsisUpstreamData&) const = default;
};

// /data/usofdminfo.asp, one OFDMA upstream channel
struct DocsisUpstreamOfdmData {
  int64_t channel_id{};
  bool state{false};
  std::optional<int64_t> subcarrier_0_frequency;
  std::optional<double>  line_digital_attenuation;
  std::optional<double>  digital_attenuation;
  std::optional<double>  bandwidth;
  std::optional<double>  report_power;
  std::optional<double>  report_power1_6;
  std::optional<std::string> fft_size;
  bool operator==(const DocsisUpstreamOfdmData&) const = default;
};

using DocsisProvisioning   = Reading<DocsisProvisioningData>;
using DocsisOverview       = Reading<DocsisOverviewData>;
using DocsisDownstream     = Reading<DocsisDownstreamData>;
using DocsisDownstreamOfdm = Reading<DocsisDownstreamOfdmData>;
using DocsisUpstream       = Reading<DocsisUpstreamData>;
using DocsisUpstreamOfdm   = Reading<DocsisUpstreamOfdmData>;

// Everything DOCSIS in one bundle. Each part was fetched on its own, so
// the capture times differ slightly from `timestamp`.
struct DocsisStatistics {
  int64_t timestamp{};
  DocsisProvisioningData docsis_provisioning;
  DocsisOverviewData     docsis_overview;
  std::vector<DocsisDownstreamData>     docsis_downstream;
  std::vector<DocsisDownstreamOfdmData> docsis_downstream_ofdm;
  std::vector<DocsisUpstreamData>       docsis_upstream;
  std::vector<DocsisUpstreamOfdmData>   docsis_upstream_ofdm;
};

} // namespace modeminfo::model
