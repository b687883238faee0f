#pragma once

#include <filesystem>
#include <string>
#include "model/Flattened.hpp"

namespace modeminfo::app {

// Appends flattened statistics rows to <dir>/<address>.csv. The header
// line is written only when the file is empty.
class CsvWriter {
public:
  CsvWriter(std::filesystem::path dir, const std::string& address);

  // Throws std::runtime_error if the file cannot be opened or written.
  void write(const model::FlattenedStatistics& row);

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  // RFC 4180 field quoting
  [[nodiscard]] static std::string escape(const std::string& field);

private:
  std::filesystem::path path_;
};

} // namespace modeminfo::app
