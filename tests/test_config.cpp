#include "minitest.hpp"
#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("modeminfo_test_config_" + std::to_string(::getpid()) + "_" + suffix + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

static void clear_env() {
  for (const char* n : {"MODEMINFO_ADDRESS", "MODEMINFO_SCHEME", "MODEMINFO_TIMEOUT_MS",
                        "MODEMINFO_OUTPUT_PATH", "MODEMINFO_INTERVAL_S", "MODEMINFO_CSV",
                        "MODEMINFO_JSONL", "MODEMINFO_REPLAY_ROOT", "MODEMINFO_CONFIG",
                        "modeminfo_address"})
    ::unsetenv(n);
}

TEST(toml_load_missing_file) {
  modeminfo::util::TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/modeminfo_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_typed_values) {
  auto path = tmp_path("typed");
  write_file(path,
    "# modem-info\n"
    "[modem]\n"
    "address = \"192.168.100.1\"\n"
    "timeout_ms = 2500   # ms\n"
    "\n"
    "[output]\n"
    "interval_s = 7.5\n"
    "csv = true\n"
    "path = \"/var/lib/modem #1\"\n"
  );
  modeminfo::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("modem", "address"), "192.168.100.1");
  ASSERT_EQ(tr.get_int("modem", "timeout_ms"), 2500);
  ASSERT_NEAR(tr.get_double("output", "interval_s"), 7.5, 1e-12);
  ASSERT_EQ(tr.get_bool("output", "csv", false), true);
  ASSERT_EQ(tr.get_string("output", "path"), "/var/lib/modem #1");
  ASSERT_EQ(tr.get_int("output", "path", -1), -1);
  ASSERT_TRUE(tr.has("output", "csv"));
  ASSERT_TRUE(!tr.has("output", "jsonl"));
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  remove_file(path);
}

TEST(config_defaults) {
  clear_env();
  auto c = modeminfo::app::load_config("");
  ASSERT_TRUE(c.address.empty());
  ASSERT_EQ(c.scheme, "http");
  ASSERT_EQ(c.timeout_ms, 10000);
  ASSERT_EQ(c.output_path, "data");
  ASSERT_NEAR(c.interval_s, 60.0, 1e-12);
  ASSERT_TRUE(!c.csv);
  ASSERT_TRUE(!c.jsonl);
  ASSERT_TRUE(c.replay_root.empty());
}

TEST(config_toml_wins_over_env) {
  clear_env();
  auto path = tmp_path("precedence");
  write_file(path, "[modem]\naddress = \"10.0.0.1\"\n[output]\njsonl = true\n");
  ::setenv("MODEMINFO_ADDRESS", "10.0.0.2", 1);
  ::setenv("MODEMINFO_CSV", "1", 1);
  ::setenv("MODEMINFO_SCHEME", "HTTPS", 1);
  auto c = modeminfo::app::load_config(path);
  ASSERT_EQ(c.address, "10.0.0.1");
  ASSERT_TRUE(c.jsonl);
  ASSERT_TRUE(c.csv);
  ASSERT_EQ(c.scheme, "https");
  clear_env();
  remove_file(path);
}

TEST(config_interval_clamped_to_minimum) {
  clear_env();
  ::setenv("MODEMINFO_INTERVAL_S", "1", 1);
  auto c = modeminfo::app::load_config("");
  ASSERT_NEAR(c.interval_s, modeminfo::app::kMinIntervalSeconds, 1e-12);
  clear_env();
}

TEST(config_env_lowercase_alias_and_replay_root) {
  clear_env();
  ::setenv("modeminfo_address", "fe80::1", 1);
  ::setenv("MODEMINFO_REPLAY_ROOT", "/tmp/fixtures", 1);
  ::setenv("MODEMINFO_TIMEOUT_MS", "abc", 1);
  auto c = modeminfo::app::load_config("");
  ASSERT_EQ(c.address, "fe80::1");
  ASSERT_EQ(c.replay_root, "/tmp/fixtures");
  ASSERT_EQ(c.timeout_ms, 10000);
  clear_env();
}

TEST(config_file_path_resolution) {
  clear_env();
  ::setenv("MODEMINFO_CONFIG", "/etc/modem-info.toml", 1);
  ASSERT_EQ(modeminfo::app::config_file_path(), "/etc/modem-info.toml");
  ::unsetenv("MODEMINFO_CONFIG");
  const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old_xdg ? old_xdg : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  ASSERT_EQ(modeminfo::app::config_file_path(), "/tmp/xdg/modem-info/config.toml");
  if (old_xdg) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1); else ::unsetenv("XDG_CONFIG_HOME");
}
