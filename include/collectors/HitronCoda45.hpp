#pragma once
#include <memory>
#include <string>
#include <vector>
#include "collectors/IModemDriver.hpp"
#include "collectors/ITransport.hpp"
#include "model/Reading.hpp"

namespace modeminfo::collectors {

// Hitron CODA-45 (pages under /data/*.asp).
class HitronCoda45 : public IDocsisModemDriver {
public:
  HitronCoda45(model::IpAddress address, std::unique_ptr<ITransport> transport);

  [[nodiscard]] const model::IpAddress& address() const override { return address_; }
  [[nodiscard]] const char* name() const override { return "Hitron CODA-45"; }

  [[nodiscard]] model::SystemInfo system_info() override;
  [[nodiscard]] model::LinkStatus link_status() override;

  [[nodiscard]] model::DocsisProvisioning docsis_provisioning() override;
  [[nodiscard]] model::DocsisOverview docsis_overview() override;
  [[nodiscard]] model::DocsisDownstream docsis_downstream() override;
  [[nodiscard]] std::optional<model::DocsisDownstreamFlattened> docsis_downstream_flattened() override;
  [[nodiscard]] model::DocsisDownstreamOfdm docsis_downstream_ofdm() override;
  [[nodiscard]] std::optional<model::DocsisDownstreamOfdmFlattened> docsis_downstream_ofdm_flattened() override;
  [[nodiscard]] model::DocsisUpstream docsis_upstream() override;
  [[nodiscard]] std::optional<model::DocsisUpstreamFlattened> docsis_upstream_flattened() override;
  [[nodiscard]] model::DocsisUpstreamOfdm docsis_upstream_ofdm() override;
  [[nodiscard]] std::optional<model::DocsisUpstreamOfdmFlattened> docsis_upstream_ofdm_flattened() override;

  [[nodiscard]] model::DocsisStatistics docsis_statistics() override;
  [[nodiscard]] model::FlattenedStatistics docsis_statistics_flattened() override;

  [[nodiscard]] std::vector<model::DecodeError> take_decode_errors() override;

  [[nodiscard]] const ITransport& transport() const { return *transport_; }

  // Backlog bound; older entries are dropped first
  static constexpr size_t kMaxDecodeErrors = 256;

private:
  // Fetch + decode; decode errors are logged, kept for take_decode_errors()
  // and the bad records dropped.
  template <class Record, class Decode>
  model::Reading<Record> get(const char* path, const char* reading, Decode decode);

  model::IpAddress address_;
  std::unique_ptr<ITransport> transport_;
  std::vector<model::DecodeError> decode_errors_;
};

} // namespace modeminfo::collectors
