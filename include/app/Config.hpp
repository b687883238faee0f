#pragma once

#include <string>

namespace modeminfo::app {

inline constexpr double kMinIntervalSeconds = 5.0;

// Runtime settings. Resolution: CLI flag (applied by main) -> TOML file
// -> MODEMINFO_* environment -> compiled default.
struct Config {
  std::string address;            // empty until supplied
  std::string scheme{"http"};
  int timeout_ms{10000};
  std::string output_path{"data"};
  double interval_s{60.0};
  bool csv{false};
  bool jsonl{false};
  std::string replay_root;        // non-empty selects the replay transport
};

// $MODEMINFO_CONFIG, else $XDG_CONFIG_HOME/modem-info/config.toml, else
// ~/.config/modem-info/config.toml. Empty if none can be formed.
std::string config_file_path();

// Load from an explicit TOML path (missing file is not an error).
Config load_config(const std::string& path);
inline Config load_config() { return load_config(config_file_path()); }

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace modeminfo::app
