#include "app/Aggregator.hpp"

namespace modeminfo::app {

using namespace modeminfo::model;

namespace {

template <class Record>
std::vector<const Record*> eligible_channels(const std::vector<Record>& all) {
  std::vector<const Record*> out;
  out.reserve(all.size());
  for (const auto& c : all)
    if (eligible(c)) out.push_back(&c);
  return out;
}

// Non-null values of one member across the eligible channels
template <class Record, class T>
std::vector<T> values_of(const std::vector<const Record*>& chans, std::optional<T> Record::*member) {
  std::vector<T> out;
  out.reserve(chans.size());
  for (const auto* c : chans)
    if (const auto& v = c->*member) out.push_back(*v);
  return out;
}

} // namespace

auto aggregate_downstream(const DocsisDownstream& r) -> std::optional<DocsisDownstreamFlattened> {
  auto chans = eligible_channels(r.data);
  if (chans.empty()) return std::nullopt;
  DocsisDownstreamFlattened f{};
  f.timestamp = r.timestamp;
  f.num_channels = chans.size();
  f.signal_strength = summarize(values_of(chans, &DocsisDownstreamData::signal_strength));
  f.snr = summarize(values_of(chans, &DocsisDownstreamData::snr));
  f.octets = summarize(values_of(chans, &DocsisDownstreamData::octets));
  f.corrected = summarize(values_of(chans, &DocsisDownstreamData::corrected));
  f.uncorrected = summarize(values_of(chans, &DocsisDownstreamData::uncorrected));
  return f;
}

auto aggregate_downstream_ofdm(const DocsisDownstreamOfdm& r) -> std::optional<DocsisDownstreamOfdmFlattened> {
  auto chans = eligible_channels(r.data);
  if (chans.empty()) return std::nullopt; // no PLC lock on any receiver
  DocsisDownstreamOfdmFlattened f{};
  f.timestamp = r.timestamp;
  f.num_channels = chans.size();
  f.plc_power = summarize(values_of(chans, &DocsisDownstreamOfdmData::plc_power));
  f.snr = summarize(values_of(chans, &DocsisDownstreamOfdmData::snr));
  f.octets = summarize(values_of(chans, &DocsisDownstreamOfdmData::octets));
  f.corrected = summarize(values_of(chans, &DocsisDownstreamOfdmData::corrected));
  f.uncorrected = summarize(values_of(chans, &DocsisDownstreamOfdmData::uncorrected));
  return f;
}

auto aggregate_upstream(const DocsisUpstream& r) -> std::optional<DocsisUpstreamFlattened> {
  auto chans = eligible_channels(r.data);
  if (chans.empty()) return std::nullopt;
  DocsisUpstreamFlattened f{};
  f.timestamp = r.timestamp;
  f.num_channels = chans.size();
  f.signal_strength = summarize(values_of(chans, &DocsisUpstreamData::signal_strength));
  return f;
}

auto aggregate_upstream_ofdm(const DocsisUpstreamOfdm& r) -> std::optional<DocsisUpstreamOfdmFlattened> {
  auto chans = eligible_channels(r.data);
  if (chans.empty()) return std::nullopt;
  DocsisUpstreamOfdmFlattened f{};
  f.timestamp = r.timestamp;
  f.num_channels = chans.size();
  f.line_digital_attenuation = summarize(values_of(chans, &DocsisUpstreamOfdmData::line_digital_attenuation));
  f.digital_attenuation = summarize(values_of(chans, &DocsisUpstreamOfdmData::digital_attenuation));
  f.report_power = summarize(values_of(chans, &DocsisUpstreamOfdmData::report_power));
  f.report_power1_6 = summarize(values_of(chans, &DocsisUpstreamOfdmData::report_power1_6));
  return f;
}

} // namespace modeminfo::app
