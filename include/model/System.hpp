#pragma once
#include <optional>
#include <string>
#include "model/Address.hpp"
#include "model/Reading.hpp"

namespace modeminfo::model {

// /data/getSysInfo.asp
struct SystemInfoData {
  std::string hw_version;
  std::string sw_version;
  std::string serial;
  MacAddress  rf_mac;
  std::string system_uptime; // free-form, e.g. "12 days 03h:14m:07s"
  std::string system_time;
  bool operator==(const SystemInfoData&) const = default;
};

// /data/getLinkStatus.asp
struct LinkStatusData {
  bool status{false}; // "up"
  std::optional<std::string> speed;
  std::optional<std::string> duplex;
  bool operator==(const LinkStatusData&) const = default;
};

using SystemInfo = Reading<SystemInfoData>;
using LinkStatus = Reading<LinkStatusData>;

} // namespace modeminfo::model
