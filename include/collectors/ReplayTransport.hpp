#pragma once
#include <string>
#include "collectors/ITransport.hpp"

namespace modeminfo::collectors {

// Serves recorded responses from a directory tree: a request for
// "/data/dsinfo.asp" reads "<root>/data/dsinfo.asp". Query strings are
// ignored.
class ReplayTransport : public ITransport {
public:
  explicit ReplayTransport(std::string root);

  [[nodiscard]] std::string fetch(const std::string& path) override;
  [[nodiscard]] const char* name() const override { return "replay"; }

  [[nodiscard]] const std::string& root() const { return root_; }

private:
  std::string root_;
};

} // namespace modeminfo::collectors
