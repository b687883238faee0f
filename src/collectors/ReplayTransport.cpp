#include "collectors/ReplayTransport.hpp"
#include "util/Files.hpp"

namespace modeminfo::collectors {

ReplayTransport::ReplayTransport(std::string root) : root_(std::move(root)) {}

std::string ReplayTransport::fetch(const std::string& path) {
  std::string clean = path.substr(0, path.find('?'));
  auto file = util::map_root_path(root_, clean);
  auto body = util::read_file_string(file);
  if (!body) throw TransportError(path, "no recorded response at " + file);
  return *body;
}

} // namespace modeminfo::collectors
