#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "model/Docsis.hpp"
#include "model/System.hpp"

namespace modeminfo::app {

// One JSON document per line, appended to
//   <dir>/<address>_system_info.jsonl
//   <dir>/<address>_link_status.jsonl
//   <dir>/<address>_docsis_statistics.jsonl
class JsonlWriter {
public:
  JsonlWriter(std::filesystem::path dir, const std::string& address);

  // Each throws std::runtime_error if the target cannot be written.
  void write(const model::SystemInfo& r);
  void write(const model::LinkStatus& r);
  void write(const model::DocsisStatistics& s);

  [[nodiscard]] const std::filesystem::path& system_info_path() const { return system_info_; }
  [[nodiscard]] const std::filesystem::path& link_status_path() const { return link_status_; }
  [[nodiscard]] const std::filesystem::path& docsis_statistics_path() const { return docsis_statistics_; }

private:
  static void append_line(const std::filesystem::path& p, const nlohmann::ordered_json& j);

  std::filesystem::path system_info_;
  std::filesystem::path link_status_;
  std::filesystem::path docsis_statistics_;
};

} // namespace modeminfo::app
