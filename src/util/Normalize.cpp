#include "util/Normalize.hpp"
#include "util/AsciiLower.hpp"

#include <arpa/inet.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <regex>
#include <vector>

namespace modeminfo::util {

bool to_bool(std::string_view v) {
  static constexpr std::array<std::string_view, 9> kTruthy{
    "1", "true", "yes", "y", "on", "success", "permitted", "enabled", "enable"};
  for (auto t : kTruthy)
    if (iequals(v, t)) return true;
  return false;
}

auto to_optional_string(std::string_view v) -> std::optional<std::string> {
  auto key = ascii_lower(trim(v));
  if (key.empty() || key == "na" || key == "n/a") return std::nullopt;
  return std::string(v);
}

auto to_int_or_none(std::string_view v) -> std::optional<int64_t> {
  auto sv = trim(v);
  if (!sv.empty() && sv.front() == '+') {
    sv.remove_prefix(1);
    if (sv.empty() || sv.front() == '-' || sv.front() == '+') return std::nullopt;
  }
  if (sv.empty()) return std::nullopt;
  int64_t out = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out, 10);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
  return out;
}

int64_t to_int_or_zero(std::string_view v) {
  return to_int_or_none(v).value_or(0);
}

auto to_float_or_none(std::string_view v) -> std::optional<double> {
  auto sv = trim(v);
  if (!sv.empty() && sv.front() == '+') {
    sv.remove_prefix(1);
    if (sv.empty() || sv.front() == '-' || sv.front() == '+') return std::nullopt;
  }
  if (sv.empty()) return std::nullopt;
  double out = 0.0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out, std::chars_format::general);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
  // nan/inf would poison every min/mean/max downstream
  if (!std::isfinite(out)) return std::nullopt;
  return out;
}

// One operand of a rollover expression: exact integer if it is one,
// otherwise a float truncated toward zero.
static auto truncated_operand(std::string_view tok) -> std::optional<int64_t> {
  if (auto i = to_int_or_none(tok)) return i;
  auto f = to_float_or_none(tok);
  if (!f) return std::nullopt;
  double t = std::trunc(*f);
  // 2^63 as a double; anything at or past it does not fit
  if (t >= 9223372036854775808.0 || t < -9223372036854775808.0) return std::nullopt;
  return static_cast<int64_t>(t);
}

auto to_big_integer(std::string_view v) -> std::optional<int64_t> {
  std::vector<std::string_view> tokens;
  size_t pos = 0;
  while (pos < v.size()) {
    while (pos < v.size() && (v[pos] == ' ' || v[pos] == '\t')) ++pos;
    size_t end = pos;
    while (end < v.size() && v[end] != ' ' && v[end] != '\t') ++end;
    if (end > pos) tokens.push_back(v.substr(pos, end - pos));
    pos = end;
  }
  if (tokens.empty()) return std::nullopt;

  auto first = truncated_operand(tokens[0]);
  if (!first) return std::nullopt;
  int64_t result = *first;
  for (size_t i = 1; i < tokens.size(); i += 2) {
    if (i + 1 >= tokens.size()) break; // dangling operator: keep what we have
    auto val = truncated_operand(tokens[i + 1]);
    if (!val) return std::nullopt;
    const auto op = tokens[i];
    if (op == "+") {
      if (__builtin_add_overflow(result, *val, &result)) return std::nullopt;
    } else if (op == "*") {
      if (__builtin_mul_overflow(result, *val, &result)) return std::nullopt;
    }
    // any other operator: operand consumed, no effect
  }
  return result;
}

auto to_duration(std::string_view v) -> std::chrono::seconds {
  static const std::regex re(R"(D: ([0-9-]+) H: ([0-9-]+) M: ([0-9-]+) S: ([0-9-]+))");
  const std::string s(v);
  std::smatch m;
  if (!std::regex_match(s, m, re)) return std::chrono::seconds{0};
  // Components outside the representable range count as a mismatch
  static constexpr std::array<int64_t, 4> kUnit{86400, 3600, 60, 1};
  int64_t total = 0;
  for (int i = 0; i < 4; ++i) {
    int64_t scaled = 0;
    if (__builtin_mul_overflow(to_int_or_zero(m.str(i + 1)), kUnit[i], &scaled) ||
        __builtin_add_overflow(total, scaled, &total))
      return std::chrono::seconds{0};
  }
  return std::chrono::seconds{total};
}

auto to_ip_address(std::string_view v) -> std::optional<model::IpAddress> {
  std::string s(v); // inet_pton wants a terminated string
  model::IpAddress out{};
  if (::inet_pton(AF_INET, s.c_str(), out.bytes.data()) == 1) {
    out.family = model::IpAddress::Family::V4;
    return out;
  }
  if (::inet_pton(AF_INET6, s.c_str(), out.bytes.data()) == 1) {
    out.family = model::IpAddress::Family::V6;
    return out;
  }
  return std::nullopt;
}

static int hexv(char c) {
  if (c>='0'&&c<='9') return c-'0';
  if (c>='a'&&c<='f') return c-'a'+10;
  if (c>='A'&&c<='F') return c-'A'+10;
  return -1;
}

auto to_mac_address(std::string_view v) -> std::optional<model::MacAddress> {
  model::MacAddress out{};
  std::string hex;
  if (v.size() == 17) {
    // aa:bb:cc:dd:ee:ff or aa-bb-cc-dd-ee-ff, one separator style throughout
    const char sep = v[2];
    if (sep != ':' && sep != '-') return std::nullopt;
    for (size_t i = 0; i < v.size(); ++i) {
      if (i % 3 == 2) { if (v[i] != sep) return std::nullopt; }
      else hex.push_back(v[i]);
    }
  } else if (v.size() == 14) {
    // aabb.ccdd.eeff
    for (size_t i = 0; i < v.size(); ++i) {
      if (i % 5 == 4) { if (v[i] != '.') return std::nullopt; }
      else hex.push_back(v[i]);
    }
  } else {
    return std::nullopt;
  }
  for (size_t i = 0; i < out.octets.size(); ++i) {
    int hi = hexv(hex[2 * i]), lo = hexv(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.octets[i] = static_cast<uint8_t>(hi * 16 + lo);
  }
  return out;
}

bool to_link_status_bool(std::string_view v) {
  return iequals(v, "up");
}

auto to_optional_dash_string(std::string_view v) -> std::optional<std::string> {
  if (v == "-") return std::nullopt;
  return std::string(v);
}

auto format_duration(std::chrono::seconds d) -> std::string {
  const bool neg = d.count() < 0;
  // magnitude in unsigned so INT64_MIN does not overflow on negation
  unsigned long long total = static_cast<unsigned long long>(d.count());
  if (neg) total = 0ULL - total;
  unsigned long long days_ = total / 86400, hours_ = (total % 86400) / 3600;
  unsigned long long mins_ = (total % 3600) / 60, secs_ = total % 60;
  char buf[112];
  if (neg) {
    std::snprintf(buf, sizeof(buf), "D: -%llu H: -%llu M: -%llu S: -%llu", days_, hours_, mins_, secs_);
  } else {
    std::snprintf(buf, sizeof(buf), "D: %llu H: %llu M: %llu S: %llu", days_, hours_, mins_, secs_);
  }
  return buf;
}

auto format_double(double v) -> std::string {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc{}) return "0";
  return std::string(buf, ptr);
}

auto format_fixed3(double v) -> std::string {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.3f", v);
  return buf;
}

} // namespace modeminfo::util
