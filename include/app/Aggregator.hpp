#pragma once
#include <algorithm>
#include <limits>
#include <optional>
#include <type_traits>
#include <vector>
#include "model/Docsis.hpp"
#include "model/Flattened.hpp"

namespace modeminfo::app {

// min/mean/max/total of a set of values, or nothing for an empty set.
// Integral totals saturate at the limits of T instead of wrapping.
template <class T>
[[nodiscard]] std::optional<model::FieldStats<T>> summarize(const std::vector<T>& values) {
  if (values.empty()) return std::nullopt;
  model::FieldStats<T> s{};
  s.count = values.size();
  auto [lo, hi] = std::minmax_element(values.begin(), values.end());
  s.min = *lo;
  s.max = *hi;
  long double acc = 0.0L;
  T total{};
  for (const auto& v : values) {
    acc += static_cast<long double>(v);
    if constexpr (std::is_integral_v<T>) {
      if (__builtin_add_overflow(total, v, &total))
        total = v < 0 ? std::numeric_limits<T>::min() : std::numeric_limits<T>::max();
    } else {
      total += v;
    }
  }
  s.total = total;
  s.mean = static_cast<double>(acc / static_cast<long double>(values.size()));
  return s;
}

// Channel inclusion rules per reading type
[[nodiscard]] inline bool eligible(const model::DocsisDownstreamData&) { return true; }
[[nodiscard]] inline bool eligible(const model::DocsisDownstreamOfdmData& c) { return c.plc_lock; }
[[nodiscard]] inline bool eligible(const model::DocsisUpstreamData&) { return true; }
[[nodiscard]] inline bool eligible(const model::DocsisUpstreamOfdmData& c) { return c.state; }

// Each returns nothing when no channel passes the inclusion rule. A
// field nobody reported is left empty inside an otherwise valid summary.
[[nodiscard]] auto aggregate_downstream(const model::DocsisDownstream& r)
    -> std::optional<model::DocsisDownstreamFlattened>;
[[nodiscard]] auto aggregate_downstream_ofdm(const model::DocsisDownstreamOfdm& r)
    -> std::optional<model::DocsisDownstreamOfdmFlattened>;
[[nodiscard]] auto aggregate_upstream(const model::DocsisUpstream& r)
    -> std::optional<model::DocsisUpstreamFlattened>;
[[nodiscard]] auto aggregate_upstream_ofdm(const model::DocsisUpstreamOfdm& r)
    -> std::optional<model::DocsisUpstreamOfdmFlattened>;

} // namespace modeminfo::app
