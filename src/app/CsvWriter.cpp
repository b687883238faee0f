#include "app/CsvWriter.hpp"
#include "app/StatisticsComposer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace modeminfo::app {

CsvWriter::CsvWriter(std::filesystem::path dir, const std::string& address)
    : path_(std::move(dir) / (address + ".csv")) {}

std::string CsvWriter::escape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void CsvWriter::write(const model::FlattenedStatistics& row) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path_, ec);
  const bool need_header = ec || size == 0;

  std::ofstream file(path_, std::ios::app);
  if (!file)
    throw std::runtime_error("CsvWriter: failed to open " + path_.string() + ": " + std::strerror(errno));

  std::string out;
  if (need_header) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i) out.push_back(',');
      out += escape(row[i].first);
    }
    out.push_back('\n');
  }
  for (size_t i = 0; i < row.size(); ++i) {
    if (i) out.push_back(',');
    out += escape(flat_value_text(row[i].second));
  }
  out.push_back('\n');

  file.write(out.data(), static_cast<std::streamsize>(out.size()));
  file.flush();
  if (!file) throw std::runtime_error("CsvWriter: write to " + path_.string() + " failed");
}

} // namespace modeminfo::app
