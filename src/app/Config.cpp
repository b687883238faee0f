#include "app/Config.hpp"
#include "util/AsciiLower.hpp"
#include "util/TomlReader.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

namespace modeminfo::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.starts_with("MODEMINFO_")) {
    alt = std::string("modeminfo_") + n.substr(10);
  } else if (n.starts_with("modeminfo_")) {
    alt = std::string("MODEMINFO_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  std::string_view s(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return defv;
  return out;
}

static double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  std::string_view s(v);
  double out = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* explicit_path = getenv_compat("MODEMINFO_CONFIG"))
    return std::string(explicit_path);
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/modem-info/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/modem-info/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  return getenv_int(env_name, def);
}

static double resolve_double(const util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  return getenv_double(env_name, def);
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  return env_flag(env_name, def);
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (const char* v = getenv_compat(env_name)) return std::string(v);
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [modem] ---
  c.address    = resolve_string(toml, have_toml, "modem", "address",    "MODEMINFO_ADDRESS", c.address);
  c.scheme     = resolve_string(toml, have_toml, "modem", "scheme",     "MODEMINFO_SCHEME", c.scheme);
  c.scheme     = util::ascii_lower(util::trim(c.scheme));
  c.timeout_ms = resolve_int(toml, have_toml, "modem", "timeout_ms",    "MODEMINFO_TIMEOUT_MS", c.timeout_ms);
  if (c.timeout_ms <= 0) c.timeout_ms = 10000;

  // --- [output] ---
  c.output_path = resolve_string(toml, have_toml, "output", "path",       "MODEMINFO_OUTPUT_PATH", c.output_path);
  c.interval_s  = resolve_double(toml, have_toml, "output", "interval_s", "MODEMINFO_INTERVAL_S", c.interval_s);
  c.csv         = resolve_bool(toml, have_toml, "output", "csv",          "MODEMINFO_CSV", c.csv);
  c.jsonl       = resolve_bool(toml, have_toml, "output", "jsonl",        "MODEMINFO_JSONL", c.jsonl);
  if (c.interval_s < kMinIntervalSeconds) {
    std::fprintf(stderr, "modem-info: Config: interval %.3fs below minimum, using %.0fs\n",
                 c.interval_s, kMinIntervalSeconds);
    c.interval_s = kMinIntervalSeconds;
  }

  if (const char* v = getenv_compat("MODEMINFO_REPLAY_ROOT")) c.replay_root = v;
  return c;
}

} // namespace modeminfo::app
