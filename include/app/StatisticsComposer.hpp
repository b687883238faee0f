#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/Flattened.hpp"

namespace modeminfo::app {

// Column order of every row compose_flattened() produces.
[[nodiscard]] const std::vector<std::string>& flattened_keys();

// One display/storage row per poll. Missing aggregates fall back to 0.0
// for levels and 0 for counters; signal, SNR and power are formatted
// with three decimals, totals stay integers. The row is stamped with
// `now` (local time, second resolution, with UTC offset), not with the
// capture times of the readings.
[[nodiscard]] model::FlattenedStatistics compose_flattened(
    const std::optional<model::DocsisDownstreamFlattened>& downstream,
    const std::optional<model::DocsisDownstreamOfdmFlattened>& downstream_ofdm,
    const std::optional<model::DocsisUpstreamFlattened>& upstream,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// "2026-10-18T09:30:00-07:00"
[[nodiscard]] std::string iso8601_local(std::chrono::system_clock::time_point tp);

[[nodiscard]] std::string flat_value_text(const model::FlatValue& v);
[[nodiscard]] nlohmann::ordered_json to_json(const model::FlattenedStatistics& row);

} // namespace modeminfo::app
