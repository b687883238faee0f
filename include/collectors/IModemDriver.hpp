#pragma once
#include <optional>
#include <vector>
#include "model/Address.hpp"
#include "model/Docsis.hpp"
#include "model/Flattened.hpp"
#include "model/Reading.hpp"
#include "model/System.hpp"

namespace modeminfo::collectors {

// Readings every supported modem exposes. Each call performs a fresh
// fetch; nothing is cached between calls. Transport failures surface as
// TransportError, malformed payloads as model::SchemaMismatch.
class IModemDriver {
public:
  virtual ~IModemDriver() = default;

  [[nodiscard]] virtual const model::IpAddress& address() const = 0;

  [[nodiscard]] virtual model::SystemInfo system_info() = 0;
  [[nodiscard]] virtual model::LinkStatus link_status() = 0;

  // Model name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;

  // Records dropped for bad fields since the previous call, oldest first.
  // Clears the backlog.
  [[nodiscard]] virtual std::vector<model::DecodeError> take_decode_errors() = 0;
};

// Cable modems that report DOCSIS channel tables.
class IDocsisModemDriver : public IModemDriver {
public:
  [[nodiscard]] virtual model::DocsisProvisioning docsis_provisioning() = 0;
  [[nodiscard]] virtual model::DocsisOverview docsis_overview() = 0;

  [[nodiscard]] virtual model::DocsisDownstream docsis_downstream() = 0;
  [[nodiscard]] virtual std::optional<model::DocsisDownstreamFlattened> docsis_downstream_flattened() = 0;
  [[nodiscard]] virtual model::DocsisDownstreamOfdm docsis_downstream_ofdm() = 0;
  [[nodiscard]] virtual std::optional<model::DocsisDownstreamOfdmFlattened> docsis_downstream_ofdm_flattened() = 0;

  [[nodiscard]] virtual model::DocsisUpstream docsis_upstream() = 0;
  [[nodiscard]] virtual std::optional<model::DocsisUpstreamFlattened> docsis_upstream_flattened() = 0;
  [[nodiscard]] virtual model::DocsisUpstreamOfdm docsis_upstream_ofdm() = 0;
  [[nodiscard]] virtual std::optional<model::DocsisUpstreamOfdmFlattened> docsis_upstream_ofdm_flattened() = 0;

  // First provisioning and overview record plus all channel lists.
  // Throws model::SchemaMismatch if provisioning or overview is empty.
  [[nodiscard]] virtual model::DocsisStatistics docsis_statistics() = 0;
  [[nodiscard]] virtual model::FlattenedStatistics docsis_statistics_flattened() = 0;
};

} // namespace modeminfo::collectors
