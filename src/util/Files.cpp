#include "util/Files.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace modeminfo::util {

auto map_root_path(const std::string& root, const std::string& abs) -> std::string {
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.starts_with('/') ? abs.substr(1) : abs); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& path) -> std::optional<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return s;
}

} // namespace modeminfo::util
