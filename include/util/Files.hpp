// Small file helpers for replay fixtures and writers
#pragma once
#include <optional>
#include <string>

namespace modeminfo::util {

// Join an absolute request path under an alternate root
// ("/data/dsinfo.asp" under "/tmp/fx" -> "/tmp/fx/data/dsinfo.asp").
auto map_root_path(const std::string& root, const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& path) -> std::optional<std::string>;

} // namespace modeminfo::util
