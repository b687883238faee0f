#pragma once
#include <string>
#include <string_view>

namespace modeminfo::util {

constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

inline std::string ascii_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(static_cast<unsigned char>(c));
  return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (ascii_lower(static_cast<unsigned char>(a[i])) != ascii_lower(static_cast<unsigned char>(b[i]))) return false;
  return true;
}

inline std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front()==' '||sv.front()=='\t'||sv.front()=='\r'||sv.front()=='\n'||sv.front()=='\f'||sv.front()=='\v')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back()==' '||sv.back()=='\t'||sv.back()=='\r'||sv.back()=='\n'||sv.back()=='\f'||sv.back()=='\v')) sv.remove_suffix(1);
  return sv;
}

} // namespace modeminfo::util
