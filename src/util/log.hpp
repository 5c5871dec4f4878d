#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace modvault::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
// Throws std::runtime_error on an unknown level name.
LogLevel ParseLogLevel(std::string_view value);

// Process-wide logger. Lines look like
//   [2026-10-19 12:00:00] [INFO] [upgrade] account 0x.. 1 -> 2
// and go to an optional append-only file (with size-based rotation) and,
// when enabled, to stderr.
class Logger {
 public:
  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void EnableFile(const std::string& path);
  void DisableFile();
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  void SetStderr(bool enabled);

  void Log(LogLevel level, std::string_view component, std::string_view message);
  bool Enabled(LogLevel level) const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
  bool stderr_enabled_{false};
};

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

}  // namespace modvault::util
