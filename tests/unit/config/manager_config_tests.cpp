#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/manager_config.hpp"

using namespace modvault;

namespace {

std::filesystem::path WriteConf(const std::string& name, const std::string& body) {
  const auto dir = std::filesystem::temp_directory_path() / "modvault-config-tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / name;
  std::ofstream out(path, std::ios::trunc);
  out << body;
  return path;
}

bool TestLoadConfigFile() {
  const auto path = WriteConf("basic.conf",
                              "# modvault settings\n"
                              "data-dir = /var/lib/modvault\n"
                              "Log_Level=debug   # trailing comment\n"
                              "log-to-stderr\n"
                              "log-max-files 3\n"
                              "catalog_owner=0x00000000000000000000000000000000000000c0\n"
                              "no-such-option = 1\n");
  config::ManagerConfig cfg;
  config::LoadConfigFile(path, &cfg);
  if (cfg.data_dir != "/var/lib/modvault" || cfg.log_level != "debug" || !cfg.log_to_stderr ||
      cfg.log_max_files != 3 ||
      cfg.catalog_owner != "0x00000000000000000000000000000000000000c0") {
    std::cerr << "manager_config_tests: config file values not applied\n";
    return false;
  }
  return true;
}

bool TestErrorsCarryLocation() {
  const auto path = WriteConf("bad.conf", "data-dir=/tmp\nlog-to-stderr = maybe\n");
  config::ManagerConfig cfg;
  try {
    config::LoadConfigFile(path, &cfg);
  } catch (const std::runtime_error& ex) {
    const std::string what = ex.what();
    if (what.find(path.string() + ":2:") == std::string::npos) {
      std::cerr << "manager_config_tests: error lacks file:line: " << what << "\n";
      return false;
    }
    return true;
  }
  std::cerr << "manager_config_tests: invalid boolean accepted\n";
  return false;
}

bool TestParseHelpers() {
  if (config::NormalizeKey("Log-Max_Size-MB") != "logmaxsizemb" ||
      config::Trim("  a b \t\n") != "a b" || !config::ParseBool("") ||
      config::ParseBool("off") || !config::ParseBool("YES")) {
    std::cerr << "manager_config_tests: helper mismatch\n";
    return false;
  }
  config::ManagerConfig cfg;
  try {
    config::ApplyConfigOption("log-level", "verbose", &cfg);
    std::cerr << "manager_config_tests: invalid log level accepted\n";
    return false;
  } catch (const std::runtime_error&) {
  }
  return !config::ApplyConfigOption("features", "x", &cfg) && config::IsConfigKey("snapshot");
}

bool TestPrecedence() {
  const auto path = WriteConf("precedence.conf", "data-dir=/from/file\nlog-level=warn\n");
  ::setenv("MODVAULT_DATA_DIR", "/from/env", 1);
  ::setenv("MODVAULT_LOG_LEVEL", "error", 1);
  std::vector<std::string> rest;
  const auto cfg = config::ParseManagerConfig(
      {"--conf", path.string(), "--log-level=debug", "add-version", "--features", "0x01"},
      &rest);
  ::unsetenv("MODVAULT_DATA_DIR");
  ::unsetenv("MODVAULT_LOG_LEVEL");
  if (cfg.data_dir != "/from/env" || cfg.log_level != "debug") {
    std::cerr << "manager_config_tests: precedence wrong (data_dir=" << cfg.data_dir
              << ", log_level=" << cfg.log_level << ")\n";
    return false;
  }
  const std::vector<std::string> expected{"add-version", "--features", "0x01"};
  if (rest != expected) {
    std::cerr << "manager_config_tests: command arguments not passed through\n";
    return false;
  }
  if (config::ResolveSnapshotPath(cfg) != std::filesystem::path("/from/env") / "manager.snapshot") {
    std::cerr << "manager_config_tests: default snapshot path wrong\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestLoadConfigFile();
  ok &= TestErrorsCarryLocation();
  ok &= TestParseHelpers();
  ok &= TestPrecedence();
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "manager_config_tests: OK\n";
  return EXIT_SUCCESS;
}
