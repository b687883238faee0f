#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace modeminfo::model {

// One payload from the modem: the decoded records plus capture time.
template <class Record>
struct Reading {
  int64_t timestamp{}; // ns since epoch, wall clock
  std::vector<Record> data;
};

// A required field on a single record that could not be parsed.
// Sibling records of the same payload are unaffected.
struct DecodeError {
  std::string reading;   // e.g. "DOCSISDownstream"
  size_t index{};        // position of the record in the payload array
  std::string field;     // wire field name
  std::string raw_value;
  std::string message;
};

template <class Record>
struct DecodeResult {
  Reading<Record> reading;
  std::vector<DecodeError> errors;
  bool ok() const { return errors.empty(); }
};

// Payload shape does not match the reading type (not JSON, not an array,
// empty where one record is mandatory).
class SchemaMismatch : public std::runtime_error {
public:
  SchemaMismatch(std::string reading, const std::string& what, std::string raw)
      : std::runtime_error(reading + ": " + what), reading_(std::move(reading)), raw_(std::move(raw)) {}
  const std::string& reading() const noexcept { return reading_; }
  const std::string& raw() const noexcept { return raw_; }
private:
  std::string reading_;
  std::string raw_;
};

} // namespace modeminfo::model
