#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "snip/common.hpp"

namespace snip::config {

// Configuration for the snip tool
class Config {
 public:
  // Default values, no file is read
  Config();

  // Path of the SQLite database file
  std::filesystem::path database;

  // Logging
  std::string log_level = "warn";          // trace, debug, info, warn, error, critical, off
  std::optional<std::filesystem::path> log_file;

  struct AttachmentConfig {
    std::uintmax_t max_size = 100 * 1024 * 1024;  // Import size limit in bytes
  };
  AttachmentConfig attachments;

  struct PerformanceConfig {
    std::string sqlite_journal_mode = "WAL";
    std::string sqlite_synchronous = "NORMAL";
    int busy_timeout_ms = 5000;
  };
  PerformanceConfig performance;

  // Load overrides from a TOML file on top of the current values
  Result<void> load(const std::filesystem::path& config_path);

  // Validate configuration values
  Result<void> validate() const;

  // Default config file location
  static std::filesystem::path defaultConfigPath();

  // Defaults, then the given file (or the default file if it exists), then validation
  static Result<Config> fromFile(const std::optional<std::filesystem::path>& config_path);

 private:
  std::filesystem::path config_path_;
};

}  // namespace snip::config
