#include "collectors/Decoders.hpp"
#include "collectors/FieldTable.hpp"
#include "util/Normalize.hpp"

#include <cmath>
#include <optional>

namespace modeminfo::collectors {

using nlohmann::json;
using nlohmann::ordered_json;
using namespace modeminfo::model;

namespace {

template <class T>
ordered_json opt_json(const std::optional<T>& v) {
  if (!v) return ordered_json(nullptr);
  return ordered_json(*v);
}

// ---- codecs -----------------------------------------------------------

const Codec<std::string> kString{
  [](std::string_view raw, std::string& out) { out = std::string(raw); return true; },
  [](const std::string& v) { return ordered_json(v); },
  [](const std::string& v) { return v; }};

const Codec<bool> kBool{
  [](std::string_view raw, bool& out) { out = util::to_bool(raw); return true; },
  [](const bool& v) { return ordered_json(v); },
  [](const bool& v) { return std::string(v ? "true" : "false"); }};

const Codec<bool> kLinkUp{
  [](std::string_view raw, bool& out) { out = util::to_link_status_bool(raw); return true; },
  [](const bool& v) { return ordered_json(v); },
  [](const bool& v) { return std::string(v ? "up" : "down"); }};

const Codec<int64_t> kIndex{
  [](std::string_view raw, int64_t& out) {
    auto v = util::to_int_or_none(raw);
    if (!v) return false;
    out = *v;
    return true;
  },
  [](const int64_t& v) { return ordered_json(v); },
  [](const int64_t& v) { return std::to_string(v); }};

const Codec<std::optional<int64_t>> kIntOrNone{
  [](std::string_view raw, std::optional<int64_t>& out) { out = util::to_int_or_none(raw); return true; },
  [](const std::optional<int64_t>& v) { return opt_json(v); },
  [](const std::optional<int64_t>& v) { return v ? std::to_string(*v) : std::string(); }};

// Integer field the firmware may report in float notation ("1.5e8").
const Codec<std::optional<int64_t>> kIntegralFloat{
  [](std::string_view raw, std::optional<int64_t>& out) {
    out = util::to_int_or_none(raw);
    if (out) return true;
    auto f = util::to_float_or_none(raw);
    if (f && std::trunc(*f) == *f && std::fabs(*f) < 9.2e18) out = static_cast<int64_t>(*f);
    return true;
  },
  [](const std::optional<int64_t>& v) { return opt_json(v); },
  [](const std::optional<int64_t>& v) { return v ? std::to_string(*v) : std::string(); }};

const Codec<std::optional<int64_t>> kBigInt{
  [](std::string_view raw, std::optional<int64_t>& out) { out = util::to_big_integer(raw); return true; },
  [](const std::optional<int64_t>& v) { return opt_json(v); },
  [](const std::optional<int64_t>& v) { return v ? std::to_string(*v) : std::string(); }};

const Codec<std::optional<double>> kFloatOrNone{
  [](std::string_view raw, std::optional<double>& out) { out = util::to_float_or_none(raw); return true; },
  [](const std::optional<double>& v) { return opt_json(v); },
  [](const std::optional<double>& v) { return v ? util::format_double(*v) : std::string(); }};

const Codec<std::optional<std::string>> kOptString{
  [](std::string_view raw, std::optional<std::string>& out) { out = util::to_optional_string(raw); return true; },
  [](const std::optional<std::string>& v) { return opt_json(v); },
  [](const std::optional<std::string>& v) { return v.value_or(std::string()); }};

const Codec<std::optional<std::string>> kDashString{
  [](std::string_view raw, std::optional<std::string>& out) { out = util::to_optional_dash_string(raw); return true; },
  [](const std::optional<std::string>& v) { return opt_json(v); },
  [](const std::optional<std::string>& v) { return v.value_or(std::string("-")); }};

const Codec<std::optional<IpAddress>> kIpAddress{
  [](std::string_view raw, std::optional<IpAddress>& out) { out = util::to_ip_address(raw); return true; },
  [](const std::optional<IpAddress>& v) { return v ? ordered_json(v->str()) : ordered_json(nullptr); },
  [](const std::optional<IpAddress>& v) { return v ? v->str() : std::string(); }};

const Codec<MacAddress> kMacAddress{
  [](std::string_view raw, MacAddress& out) {
    auto v = util::to_mac_address(raw);
    if (!v) return false;
    out = *v;
    return true;
  },
  [](const MacAddress& v) { return ordered_json(v.str()); },
  [](const MacAddress& v) { return v.str(); }};

// Lease durations are written to JSON as whole seconds.
const Codec<std::chrono::seconds> kDuration{
  [](std::string_view raw, std::chrono::seconds& out) { out = util::to_duration(raw); return true; },
  [](const std::chrono::seconds& v) { return ordered_json(static_cast<int64_t>(v.count())); },
  [](const std::chrono::seconds& v) { return util::format_duration(v); }};

constexpr bool kRequired = true;

// ---- field tables (built once) ----------------------------------------

const std::vector<FieldSpec<SystemInfoData>>& system_info_table() {
  static const std::vector<FieldSpec<SystemInfoData>> t{
    field("hwVersion",    "hw_version",    &SystemInfoData::hw_version,    kString, kRequired),
    field("swVersion",    "sw_version",    &SystemInfoData::sw_version,    kString, kRequired),
    field("serialNumber", "serial",        &SystemInfoData::serial,        kString, kRequired),
    field("rfMac",        "rf_mac",        &SystemInfoData::rf_mac,        kMacAddress, kRequired),
    field("systemUptime", "system_uptime", &SystemInfoData::system_uptime, kString, kRequired),
    field("systemTime",   "system_time",   &SystemInfoData::system_time,   kString, kRequired),
  };
  return t;
}

const std::vector<FieldSpec<LinkStatusData>>& link_status_table() {
  static const std::vector<FieldSpec<LinkStatusData>> t{
    field("LinkStatus", "status", &LinkStatusData::status, kLinkUp, kRequired),
    field("LinkSpeed",  "speed",  &LinkStatusData::speed,  kDashString),
    field("LinkDuplex", "duplex", &LinkStatusData::duplex, kDashString),
  };
  return t;
}

const std::vector<FieldSpec<DocsisProvisioningData>>& provisioning_table() {
  using P = DocsisProvisioningData;
  static const std::vector<FieldSpec<P>> t{
    field("hwInit",         "hw_init",         &P::hw_init,         kBool, kRequired),
    field("findDownstream", "find_downstream", &P::find_downstream, kBool, kRequired),
    field("ranging",        "ranging",         &P::ranging,         kBool, kRequired),
    field("dhcp",           "dhcp",            &P::dhcp,            kBool, kRequired),
    field("timeOfday",      "time_of_day",     &P::time_of_day,     kBool, kRequired),
    field("downloadCfg",    "download_config", &P::download_config, kBool, kRequired),
    field("registration",   "registration",    &P::registration,    kBool, kRequired),
    field("eaeStatus",      "eae_status",      &P::eae_status,      kBool, kRequired),
    field("bpiStatus",      "bpi_status",      &P::bpi_status,      kString, kRequired),
    field("networkAccess",  "network_access",  &P::network_access,  kBool, kRequired),
    field("trafficStatus",  "traffic_status",  &P::traffic_status,  kBool, kRequired),
  };
  return t;
}

const std::vector<FieldSpec<DocsisOverviewData>>& overview_table() {
  using O = DocsisOverviewData;
  static const std::vector<FieldSpec<O>> t{
    field("Configname",        "config_name",         &O::config_name,         kString, kRequired),
    field("ConfignameDisplay", "config_name_display", &O::config_name_display, kString, kRequired),
    field("NetworkAccess",     "network_access",      &O::network_access,      kBool, kRequired),
    field("CmIpAddress",       "ip_address",          &O::ip_address,          kIpAddress),
    field("CmNetMask",         "netmask",             &O::netmask,             kIpAddress),
    field("CmGateway",         "gateway",             &O::gateway,             kIpAddress),
    field("CmIpLeaseDuration", "lease_duration",      &O::lease_duration,      kDuration, kRequired),
  };
  return t;
}

const std::vector<FieldSpec<DocsisDownstreamData>>& downstream_table() {
  using D = DocsisDownstreamData;
  static const std::vector<FieldSpec<D>> t{
    field("portId",         "port_id",         &D::port_id,         kIndex, kRequired),
    field("frequency",      "frequency",       &D::frequency,       kIntOrNone),
    field("modulation",     "modulation",      &D::modulation,      kIntOrNone),
    field("signalStrength", "signal_strength", &D::signal_strength, kFloatOrNone),
    field("snr",            "snr",             &D::snr,             kFloatOrNone),
    field("dsoctets",       "octets",          &D::octets,          kBigInt),
    field("correcteds",     "corrected",       &D::corrected,       kIntOrNone),
    field("uncorrect",      "uncorrected",     &D::uncorrected,     kIntOrNone),
    field("channelId",      "channel_id",      &D::channel_id,      kIntOrNone),
  };
  return t;
}

const std::vector<FieldSpec<DocsisDownstreamOfdmData>>& downstream_ofdm_table() {
  using D = DocsisDownstreamOfdmData;
  static const std::vector<FieldSpec<D>> t{
    field("receive",          "receiver",               &D::receiver,               kIndex, kRequired),
    field("ffttype",          "fft_type",               &D::fft_type,               kOptString),
    field("Subcarr0freqFreq", "subcarrier_0_frequency", &D::subcarrier_0_frequency, kIntegralFloat),
    field("plclock",          "plc_lock",               &D::plc_lock,               kBool),
    field("ncplock",          "ncp_lock",               &D::ncp_lock,               kBool),
    field("mdc1lock",         "mdc1_lock",              &D::mdc1_lock,              kBool),
    field("plcpower",         "plc_power",              &D::plc_power,              kFloatOrNone),
    field("SNR",              "snr",                    &D::snr,                    kFloatOrNone),
    field("dsoctets",         "octets",                 &D::octets,                 kIntOrNone),
    field("correcteds",       "corrected",              &D::corrected,              kIntOrNone),
    field("uncorrect",        "uncorrected",            &D::uncorrected,            kIntOrNone),
  };
  return t;
}

const std::vector<FieldSpec<DocsisUpstreamData>>& upstream_table() {
  using U = DocsisUpstreamData;
  static const std::vector<FieldSpec<U>> t{
    field("portId",         "port_id",         &U::port_id,         kIndex, kRequired),
    field("frequency",      "frequency",       &U::frequency,       kIntOrNone),
    field("bandwidth",      "bandwidth",       &U::bandwidth,       kIntOrNone),
    field("modtype",        "modulation",      &U::modulation,      kOptString),
    field("scdmaMode",      "docsis_mode",     &U::docsis_mode,     kOptString),
    field("signalStrength", "signal_strength", &U::signal_strength, kFloatOrNone),
    field("channelId",      "channel_id",      &U::channel_id,      kIntOrNone),
  };
  return t;
}

const std::vector<FieldSpec<DocsisUpstreamOfdmData>>& upstream_ofdm_table() {
  using U = DocsisUpstreamOfdmData;
  static const std::vector<FieldSpec<U>> t{
    field("uschindex",   "channel_id",               &U::channel_id,               kIndex, kRequired),
    field("state",       "state",                    &U::state,                    kBool),
    field("frequency",   "subcarrier_0_frequency",   &U::subcarrier_0_frequency,   kIntOrNone),
    field("digAtten",    "line_digital_attenuation", &U::line_digital_attenuation, kFloatOrNone),
    field("digAttenBo",  "digital_attenuation",      &U::digital_attenuation,      kFloatOrNone),
    field("channelBw",   "bandwidth",                &U::bandwidth,                kFloatOrNone),
    field("repPower",    "report_power",             &U::report_power,             kFloatOrNone),
    field("repPower1_6", "report_power1_6",          &U::report_power1_6,          kFloatOrNone),
    field("fftVal",      "fft_size",                 &U::fft_size,                 kOptString),
  };
  return t;
}

} // namespace

json parse_payload(const char* reading, const std::string& body) {
  try {
    return json::parse(body);
  } catch (const json::parse_error& e) {
    throw SchemaMismatch(reading, std::string("invalid JSON: ") + e.what(), body);
  }
}

DecodeResult<SystemInfoData> decode_system_info(const json& payload, int64_t timestamp) {
  return decode_with(kSystemInfo, system_info_table(), payload, timestamp);
}
DecodeResult<LinkStatusData> decode_link_status(const json& payload, int64_t timestamp) {
  return decode_with(kLinkStatus, link_status_table(), payload, timestamp);
}
DecodeResult<DocsisProvisioningData> decode_docsis_provisioning(const json& payload, int64_t timestamp) {
  return decode_with(kDocsisProvisioning, provisioning_table(), payload, timestamp);
}
DecodeResult<DocsisOverviewData> decode_docsis_overview(const json& payload, int64_t timestamp) {
  return decode_with(kDocsisOverview, overview_table(), payload, timestamp);
}
DecodeResult<DocsisDownstreamData> decode_docsis_downstream(const json& payload, int64_t timestamp) {
  return decode_with(kDocsisDownstream, downstream_table(), payload, timestamp);
}
DecodeResult<DocsisDownstreamOfdmData> decode_docsis_downstream_ofdm(const json& payload, int64_t timestamp) {
  return decode_with(kDocsisDownstreamOfdm, downstream_ofdm_table(), payload, timestamp);
}
DecodeResult<DocsisUpstreamData> decode_docsis_upstream(const json& payload, int64_t timestamp) {
  return decode_with(kDocsisUpstream, upstream_table(), payload, timestamp);
}
DecodeResult<DocsisUpstreamOfdmData> decode_docsis_upstream_ofdm(const json& payload, int64_t timestamp) {
  return decode_with(kDocsisUpstreamOfdm, upstream_ofdm_table(), payload, timestamp);
}

ordered_json to_json(const SystemInfoData& r) { return encode_json(system_info_table(), r); }
ordered_json to_json(const LinkStatusData& r) { return encode_json(link_status_table(), r); }
ordered_json to_json(const DocsisProvisioningData& r) { return encode_json(provisioning_table(), r); }
ordered_json to_json(const DocsisOverviewData& r) { return encode_json(overview_table(), r); }
ordered_json to_json(const DocsisDownstreamData& r) { return encode_json(downstream_table(), r); }
ordered_json to_json(const DocsisDownstreamOfdmData& r) { return encode_json(downstream_ofdm_table(), r); }
ordered_json to_json(const DocsisUpstreamData& r) { return encode_json(upstream_table(), r); }
ordered_json to_json(const DocsisUpstreamOfdmData& r) { return encode_json(upstream_ofdm_table(), r); }

ordered_json to_json(const DocsisStatistics& s) {
  auto list = [](const auto& v) {
    ordered_json arr = ordered_json::array();
    for (const auto& r : v) arr.push_back(to_json(r));
    return arr;
  };
  ordered_json j = ordered_json::object();
  j["timestamp"] = s.timestamp;
  j["docsis_provisioning"] = to_json(s.docsis_provisioning);
  j["docsis_overview"] = to_json(s.docsis_overview);
  j["docsis_downstream"] = list(s.docsis_downstream);
  j["docsis_downstream_ofdm"] = list(s.docsis_downstream_ofdm);
  j["docsis_upstream"] = list(s.docsis_upstream);
  j["docsis_upstream_ofdm"] = list(s.docsis_upstream_ofdm);
  return j;
}

ordered_json to_wire(const SystemInfoData& r) { return encode_wire(system_info_table(), r); }
ordered_json to_wire(const LinkStatusData& r) { return encode_wire(link_status_table(), r); }
ordered_json to_wire(const DocsisProvisioningData& r) { return encode_wire(provisioning_table(), r); }
ordered_json to_wire(const DocsisOverviewData& r) { return encode_wire(overview_table(), r); }
ordered_json to_wire(const DocsisDownstreamData& r) { return encode_wire(downstream_table(), r); }
ordered_json to_wire(const DocsisDownstreamOfdmData& r) { return encode_wire(downstream_ofdm_table(), r); }
ordered_json to_wire(const DocsisUpstreamData& r) { return encode_wire(upstream_table(), r); }
ordered_json to_wire(const DocsisUpstreamOfdmData& r) { return encode_wire(upstream_ofdm_table(), r); }

} // namespace modeminfo::collectors
