#include "model/Address.hpp"

#include <arpa/inet.h>

#include <cstdio>

namespace modeminfo::model {

std::string IpAddress::str() const {
  char buf[INET6_ADDRSTRLEN]{};
  int af = (family == Family::V4) ? AF_INET : AF_INET6;
  if (!::inet_ntop(af, bytes.data(), buf, sizeof(buf))) return {};
  return buf;
}

std::string MacAddress::str() const {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                octets[0], octets[1], octets[2], octets[3], octets[4], octets[5]);
  return buf;
}

} // namespace modeminfo::model
