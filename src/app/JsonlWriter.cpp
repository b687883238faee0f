#include "app/JsonlWriter.hpp"
#include "collectors/Decoders.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace modeminfo::app {

JsonlWriter::JsonlWriter(std::filesystem::path dir, const std::string& address)
    : system_info_(dir / (address + "_system_info.jsonl")),
      link_status_(dir / (address + "_link_status.jsonl")),
      docsis_statistics_(dir / (address + "_docsis_statistics.jsonl")) {}

void JsonlWriter::append_line(const std::filesystem::path& p, const nlohmann::ordered_json& j) {
  std::ofstream file(p, std::ios::app);
  if (!file)
    throw std::runtime_error("JsonlWriter: failed to open " + p.string() + ": " + std::strerror(errno));
  // Modem strings are not guaranteed UTF-8
  std::string line = j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  line.push_back('\n');
  file.write(line.data(), static_cast<std::streamsize>(line.size()));
  file.flush();
  if (!file) throw std::runtime_error("JsonlWriter: write to " + p.string() + " failed");
}

void JsonlWriter::write(const model::SystemInfo& r) {
  append_line(system_info_, collectors::to_json(r));
}

void JsonlWriter::write(const model::LinkStatus& r) {
  append_line(link_status_, collectors::to_json(r));
}

void JsonlWriter::write(const model::DocsisStatistics& s) {
  append_line(docsis_statistics_, collectors::to_json(s));
}

} // namespace modeminfo::app
