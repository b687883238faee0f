#pragma once
#include <chrono>
#include <string>
#include "collectors/ITransport.hpp"
#include "model/Address.hpp"

namespace modeminfo::collectors {

// libcurl GET against the modem's web interface. Every request carries a
// "_=<epoch ms>" cache buster like the vendor UI does.
class HttpTransport : public ITransport {
public:
  // Throws std::invalid_argument unless scheme is "http" or "https".
  HttpTransport(const model::IpAddress& address, std::string scheme = "http",
                std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

  [[nodiscard]] std::string fetch(const std::string& path) override;
  [[nodiscard]] const char* name() const override { return "http"; }

  [[nodiscard]] const std::string& base_url() const { return base_url_; }

  // "http://[fe80::1]/data/dsinfo.asp?_=1718000000123"
  [[nodiscard]] std::string url_for(const std::string& path, long long epoch_ms) const;

private:
  std::string base_url_;
  std::chrono::milliseconds timeout_;
};

} // namespace modeminfo::collectors
