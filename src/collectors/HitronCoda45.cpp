#include "collectors/HitronCoda45.hpp"
#include "collectors/Decoders.hpp"
#include "app/Aggregator.hpp"
#include "app/StatisticsComposer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace modeminfo::collectors {

using namespace modeminfo::model;

namespace {

constexpr const char* kSysInfoPath      = "/data/getSysInfo.asp";
constexpr const char* kLinkStatusPath   = "/data/getLinkStatus.asp";
constexpr const char* kCmInitPath       = "/data/getCMInit.asp";
constexpr const char* kDocsisWanPath    = "/data/getCmDocsisWan.asp";
constexpr const char* kDsInfoPath       = "/data/dsinfo.asp";
constexpr const char* kDsOfdmInfoPath   = "/data/dsofdminfo.asp";
constexpr const char* kUsInfoPath       = "/data/usinfo.asp";
constexpr const char* kUsOfdmInfoPath   = "/data/usofdminfo.asp";

int64_t now_ns() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

HitronCoda45::HitronCoda45(IpAddress address, std::unique_ptr<ITransport> transport)
    : address_(std::move(address)), transport_(std::move(transport)) {
  if (!transport_) throw std::invalid_argument("HitronCoda45: transport is null");
}

template <class Record, class Decode>
Reading<Record> HitronCoda45::get(const char* path, const char* reading, Decode decode) {
  const int64_t ts = now_ns();
  auto payload = parse_payload(reading, transport_->fetch(path));
  DecodeResult<Record> res = decode(payload, ts);
  for (const auto& e : res.errors) {
    std::fprintf(stderr, "modem-info: %s: record %zu field '%s' value '%s': %s\n",
                 e.reading.c_str(), e.index, e.field.c_str(), e.raw_value.c_str(), e.message.c_str());
  }
  decode_errors_.insert(decode_errors_.end(),
                        std::make_move_iterator(res.errors.begin()), std::make_move_iterator(res.errors.end()));
  if (decode_errors_.size() > kMaxDecodeErrors)
    decode_errors_.erase(decode_errors_.begin(),
                         decode_errors_.begin() + static_cast<std::ptrdiff_t>(decode_errors_.size() - kMaxDecodeErrors));
  return std::move(res.reading);
}

std::vector<DecodeError> HitronCoda45::take_decode_errors() {
  return std::exchange(decode_errors_, {});
}

SystemInfo HitronCoda45::system_info() {
  return get<SystemInfoData>(kSysInfoPath, kSystemInfo, decode_system_info);
}

LinkStatus HitronCoda45::link_status() {
  return get<LinkStatusData>(kLinkStatusPath, kLinkStatus, decode_link_status);
}

DocsisProvisioning HitronCoda45::docsis_provisioning() {
  return get<DocsisProvisioningData>(kCmInitPath, kDocsisProvisioning, decode_docsis_provisioning);
}

DocsisOverview HitronCoda45::docsis_overview() {
  return get<DocsisOverviewData>(kDocsisWanPath, kDocsisOverview, decode_docsis_overview);
}

DocsisDownstream HitronCoda45::docsis_downstream() {
  return get<DocsisDownstreamData>(kDsInfoPath, kDocsisDownstream, decode_docsis_downstream);
}

std::optional<DocsisDownstreamFlattened> HitronCoda45::docsis_downstream_flattened() {
  return app::aggregate_downstream(docsis_downstream());
}

DocsisDownstreamOfdm HitronCoda45::docsis_downstream_ofdm() {
  return get<DocsisDownstreamOfdmData>(kDsOfdmInfoPath, kDocsisDownstreamOfdm, decode_docsis_downstream_ofdm);
}

std::optional<DocsisDownstreamOfdmFlattened> HitronCoda45::docsis_downstream_ofdm_flattened() {
  return app::aggregate_downstream_ofdm(docsis_downstream_ofdm());
}

DocsisUpstream HitronCoda45::docsis_upstream() {
  return get<DocsisUpstreamData>(kUsInfoPath, kDocsisUpstream, decode_docsis_upstream);
}

std::optional<DocsisUpstreamFlattened> HitronCoda45::docsis_upstream_flattened() {
  return app::aggregate_upstream(docsis_upstream());
}

DocsisUpstreamOfdm HitronCoda45::docsis_upstream_ofdm() {
  return get<DocsisUpstreamOfdmData>(kUsOfdmInfoPath, kDocsisUpstreamOfdm, decode_docsis_upstream_ofdm);
}

std::optional<DocsisUpstreamOfdmFlattened> HitronCoda45::docsis_upstream_ofdm_flattened() {
  return app::aggregate_upstream_ofdm(docsis_upstream_ofdm());
}

DocsisStatistics HitronCoda45::docsis_statistics() {
  auto prov = docsis_provisioning();
  if (prov.data.empty())
    throw SchemaMismatch(kDocsisProvisioning, "no provisioning record", "");
  auto overview = docsis_overview();
  if (overview.data.empty())
    throw SchemaMismatch(kDocsisOverview, "no overview record", "");

  DocsisStatistics s;
  s.docsis_provisioning = std::move(prov.data.front());
  s.docsis_overview = std::move(overview.data.front());
  s.docsis_downstream = docsis_downstream().data;
  s.docsis_downstream_ofdm = docsis_downstream_ofdm().data;
  s.docsis_upstream = docsis_upstream().data;
  s.docsis_upstream_ofdm = docsis_upstream_ofdm().data;
  s.timestamp = now_ns();
  return s;
}

FlattenedStatistics HitronCoda45::docsis_statistics_flattened() {
  auto ds = docsis_downstream_flattened();
  auto ofdm = docsis_downstream_ofdm_flattened();
  auto us = docsis_upstream_flattened();
  return app::compose_flattened(ds, ofdm, us);
}

} // namespace modeminfo::collectors
