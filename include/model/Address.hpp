#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace modeminfo::model {

struct IpAddress {
  enum class Family : uint8_t { V4, V6 };
  Family family{Family::V4};
  std::array<uint8_t, 16> bytes{}; // V4 uses the first 4
  // Canonical textual form ("192.168.0.1", "2001:db8::1")
  std::string str() const;
  bool operator==(const IpAddress&) const = default;
};

struct MacAddress {
  std::array<uint8_t, 6> octets{};
  // Lower-case colon separated ("aa:bb:cc:00:11:22")
  std::string str() const;
  bool operator==(const MacAddress&) const = default;
};

} // namespace modeminfo::model
