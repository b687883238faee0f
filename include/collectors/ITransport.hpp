#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace modeminfo::collectors {

// Connect, HTTP status or file access failure while fetching a page.
class TransportError : public std::runtime_error {
public:
  TransportError(std::string path, const std::string& what)
      : std::runtime_error(what), path_(std::move(path)) {}
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
};

// Minimal interface for fetching modem pages so drivers can run against
// a live device or recorded responses.
class ITransport {
public:
  virtual ~ITransport() = default;

  // Return the response body for an absolute request path ("/data/dsinfo.asp").
  // Throws TransportError on failure.
  [[nodiscard]] virtual std::string fetch(const std::string& path) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace modeminfo::collectors
