// Normalizers for the modem's string-typed JSON fields.
// None of these throw; malformed or sentinel input degrades to the
// documented default.
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "model/Address.hpp"

namespace modeminfo::util {

// "1","true","yes","y","on","success","permitted","enabled","enable"
// (any case) are true, everything else is false.
[[nodiscard]] bool to_bool(std::string_view v);

// "", "na", "n/a" (trimmed, any case) are absent; otherwise v unchanged.
[[nodiscard]] auto to_optional_string(std::string_view v) -> std::optional<std::string>;

[[nodiscard]] int64_t to_int_or_zero(std::string_view v);
[[nodiscard]] auto to_int_or_none(std::string_view v) -> std::optional<int64_t>;
[[nodiscard]] auto to_float_or_none(std::string_view v) -> std::optional<double>;

// Counter that the firmware reports as an expression after a 32-bit
// rollover, e.g. "1234 + 3 * 4294967296". Evaluated left to right with
// no precedence; every operand is truncated to an integer first.
[[nodiscard]] auto to_big_integer(std::string_view v) -> std::optional<int64_t>;

// "D: 3 H: 2 M: 1 S: 0"; "-" components count as 0, anything that does
// not match the pattern is a zero duration.
[[nodiscard]] auto to_duration(std::string_view v) -> std::chrono::seconds;

[[nodiscard]] auto to_ip_address(std::string_view v) -> std::optional<model::IpAddress>;
[[nodiscard]] auto to_mac_address(std::string_view v) -> std::optional<model::MacAddress>;

// true iff "up" (any case)
[[nodiscard]] bool to_link_status_bool(std::string_view v);

// "-" is absent; otherwise v unchanged.
[[nodiscard]] auto to_optional_dash_string(std::string_view v) -> std::optional<std::string>;

// Inverse of to_duration, days first.
[[nodiscard]] auto format_duration(std::chrono::seconds d) -> std::string;

// Shortest round-trippable decimal text.
[[nodiscard]] auto format_double(double v) -> std::string;

// Fixed three decimals, as shown in the flattened statistics.
[[nodiscard]] auto format_fixed3(double v) -> std::string;

} // namespace modeminfo::util
