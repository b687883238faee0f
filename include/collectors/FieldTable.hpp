#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/Reading.hpp"

namespace modeminfo::collectors {

// Conversions for one member type. parse() returns false only when no
// value could be produced at all; degrading codecs always return true.
template <class T>
struct Codec {
  bool (*parse)(std::string_view raw, T& out);
  nlohmann::ordered_json (*json)(const T& v);  // typed value for JSONL
  std::string (*wire)(const T& v);     // canonical modem encoding
};

// One row of a reading's field table: wire name -> member + codec.
template <class Record>
struct FieldSpec {
  const char* wire;
  const char* name;
  bool required;
  std::function<bool(Record&, std::string_view)> decode;
  std::function<nlohmann::ordered_json(const Record&)> to_json;
  std::function<std::string(const Record&)> to_wire;
};

template <class Record, class T>
FieldSpec<Record> field(const char* wire, const char* name, T Record::*member, Codec<T> codec,
                        bool required = false) {
  return FieldSpec<Record>{
    wire, name, required,
    [member, codec](Record& r, std::string_view raw) { return codec.parse(raw, r.*member); },
    [member, codec](const Record& r) { return codec.json(r.*member); },
    [member, codec](const Record& r) { return codec.wire(r.*member); }};
}

// Text of a scalar JSON value as the normalizers expect it. Objects and
// arrays have no text form.
inline bool raw_text(const nlohmann::json& v, std::string& out) {
  if (v.is_string()) { out = v.get<std::string>(); return true; }
  if (v.is_null()) { out.clear(); return true; }
  if (v.is_boolean()) { out = v.get<bool>() ? "true" : "false"; return true; }
  if (v.is_number()) { out = v.dump(); return true; }
  return false;
}

// Decode every element of a payload array with the given table. A record
// whose required fields fail is dropped and reported; its siblings are
// still decoded. Throws SchemaMismatch if the payload is not an array.
template <class Record>
model::DecodeResult<Record> decode_with(const char* reading, const std::vector<FieldSpec<Record>>& table,
                                        const nlohmann::json& payload, int64_t timestamp) {
  if (!payload.is_array())
    throw model::SchemaMismatch(reading, std::string("expected a JSON array, got ") + payload.type_name(),
                                payload.dump());
  model::DecodeResult<Record> res;
  res.reading.timestamp = timestamp;
  size_t idx = 0;
  for (const auto& entry : payload) {
    if (!entry.is_object()) {
      res.errors.push_back({reading, idx, "", entry.dump(), "record is not a JSON object"});
      ++idx;
      continue;
    }
    Record rec{};
    bool ok = true;
    for (const auto& f : table) {
      auto it = entry.find(f.wire);
      if (it == entry.end()) {
        if (f.required) { res.errors.push_back({reading, idx, f.wire, "", "missing required field"}); ok = false; }
        continue;
      }
      std::string raw;
      if (!raw_text(*it, raw)) {
        if (f.required) { res.errors.push_back({reading, idx, f.wire, it->dump(), "not a scalar value"}); ok = false; }
        continue;
      }
      if (!f.decode(rec, raw) && f.required) {
        res.errors.push_back({reading, idx, f.wire, raw, "unparsable value"});
        ok = false;
      }
    }
    if (ok) res.reading.data.push_back(std::move(rec));
    ++idx;
  }
  return res;
}

template <class Record>
nlohmann::ordered_json encode_json(const std::vector<FieldSpec<Record>>& table, const Record& r) {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (const auto& f : table) j[f.name] = f.to_json(r);
  return j;
}

template <class Record>
nlohmann::ordered_json encode_wire(const std::vector<FieldSpec<Record>>& table, const Record& r) {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (const auto& f : table) j[f.wire] = f.to_wire(r);
  return j;
}

} // namespace modeminfo::collectors
