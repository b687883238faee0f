#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "model/Docsis.hpp"
#include "model/System.hpp"

namespace modeminfo::collectors {

// Reading names used in errors and logs
inline constexpr const char* kSystemInfo = "SystemInfo";
inline constexpr const char* kLinkStatus = "LinkStatus";
inline constexpr const char* kDocsisProvisioning = "DOCSISProvisioning";
inline constexpr const char* kDocsisOverview = "DOCSISOverview";
inline constexpr const char* kDocsisDownstream = "DOCSISDownstream";
inline constexpr const char* kDocsisDownstreamOfdm = "DOCSISDownstreamOFDM";
inline constexpr const char* kDocsisUpstream = "DOCSISUpstream";
inline constexpr const char* kDocsisUpstreamOfdm = "DOCSISUpstreamOFDM";

// Parse a response body. Throws SchemaMismatch on invalid JSON.
[[nodiscard]] nlohmann::json parse_payload(const char* reading, const std::string& body);

// Payload must be a JSON array of objects (SchemaMismatch otherwise).
// timestamp is the capture time in ns since epoch.
[[nodiscard]] model::DecodeResult<model::SystemInfoData> decode_system_info(const nlohmann::json& payload, int64_t timestamp);
[[nodiscard]] model::DecodeResult<model::LinkStatusData> decode_link_status(const nlohmann::json& payload, int64_t timestamp);
[[nodiscard]] model::DecodeResult<model::DocsisProvisioningData> decode_docsis_provisioning(const nlohmann::json& payload, int64_t timestamp);
[[nodiscard]] model::DecodeResult<model::DocsisOverviewData> decode_docsis_overview(const nlohmann::json& payload, int64_t timestamp);
[[nodiscard]] model::DecodeResult<model::DocsisDownstreamData> decode_docsis_downstream(const nlohmann::json& payload, int64_t timestamp);
[[nodiscard]] model::DecodeResult<model::DocsisDownstreamOfdmData> decode_docsis_downstream_ofdm(const nlohmann::json& payload, int64_t timestamp);
[[nodiscard]] model::DecodeResult<model::DocsisUpstreamData> decode_docsis_upstream(const nlohmann::json& payload, int64_t timestamp);
[[nodiscard]] model::DecodeResult<model::DocsisUpstreamOfdmData> decode_docsis_upstream_ofdm(const nlohmann::json& payload, int64_t timestamp);

// Normalized field names with typed values (JSONL output).
nlohmann::ordered_json to_json(const model::SystemInfoData& r);
nlohmann::ordered_json to_json(const model::LinkStatusData& r);
nlohmann::ordered_json to_json(const model::DocsisProvisioningData& r);
nlohmann::ordered_json to_json(const model::DocsisOverviewData& r);
nlohmann::ordered_json to_json(const model::DocsisDownstreamData& r);
nlohmann::ordered_json to_json(const model::DocsisDownstreamOfdmData& r);
nlohmann::ordered_json to_json(const model::DocsisUpstreamData& r);
nlohmann::ordered_json to_json(const model::DocsisUpstreamOfdmData& r);
nlohmann::ordered_json to_json(const model::DocsisStatistics& s);

template <class Record>
nlohmann::ordered_json to_json(const model::Reading<Record>& reading) {
  nlohmann::ordered_json data = nlohmann::ordered_json::array();
  for (const auto& r : reading.data) data.push_back(to_json(r));
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  j["timestamp"] = reading.timestamp;
  j["data"] = std::move(data);
  return j;
}

// Wire field names with canonical string values; decoding the result
// yields the same record.
nlohmann::ordered_json to_wire(const model::SystemInfoData& r);
nlohmann::ordered_json to_wire(const model::LinkStatusData& r);
nlohmann::ordered_json to_wire(const model::DocsisProvisioningData& r);
nlohmann::ordered_json to_wire(const model::DocsisOverviewData& r);
nlohmann::ordered_json to_wire(const model::DocsisDownstreamData& r);
nlohmann::ordered_json to_wire(const model::DocsisDownstreamOfdmData& r);
nlohmann::ordered_json to_wire(const model::DocsisUpstreamData& r);
nlohmann::ordered_json to_wire(const model::DocsisUpstreamOfdmData& r);

} // namespace modeminfo::collectors
