#include "snip/config/config.hpp"

#include <algorithm>
#include <array>

#include <toml++/toml.hpp>

#include "snip/util/xdg.hpp"

namespace snip::config {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

constexpr std::array<std::string_view, 6> kJournalModes = {
    "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};

constexpr std::array<std::string_view, 4> kSynchronousModes = {
    "OFF", "NORMAL", "FULL", "EXTRA"};

template <size_t N>
bool contains(const std::array<std::string_view, N>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

Config::Config() {
  database = snip::util::Xdg::databaseFile();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["database"].value<std::string>()) {
      database = *value;
    }
    if (auto value = config_data["log_level"].value<std::string>()) {
      log_level = *value;
    }
    if (auto value = config_data["log_file"].value<std::string>()) {
      log_file = std::filesystem::path(*value);
    }

    if (auto attachments_table = config_data["attachments"].as_table()) {
      if (auto value = (*attachments_table)["max_size"].value<int64_t>()) {
        if (*value < 0) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "attachments.max_size must not be negative"));
        }
        attachments.max_size = static_cast<std::uintmax_t>(*value);
      }
    }

    if (auto perf_table = config_data["performance"].as_table()) {
      if (auto value = (*perf_table)["sqlite_journal_mode"].value<std::string>()) {
        performance.sqlite_journal_mode = *value;
      }
      if (auto value = (*perf_table)["sqlite_synchronous"].value<std::string>()) {
        performance.sqlite_synchronous = *value;
      }
      if (auto value = (*perf_table)["busy_timeout_ms"].value<int64_t>()) {
        performance.busy_timeout_ms = static_cast<int>(*value);
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::validate() const {
  if (database.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "database path is empty"));
  }
  if (!contains(kLogLevels, log_level)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid log_level: " + log_level));
  }
  if (!contains(kJournalModes, performance.sqlite_journal_mode)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid sqlite_journal_mode: " + performance.sqlite_journal_mode));
  }
  if (!contains(kSynchronousModes, performance.sqlite_synchronous)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid sqlite_synchronous: " + performance.sqlite_synchronous));
  }
  if (performance.busy_timeout_ms < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "busy_timeout_ms must not be negative"));
  }
  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return snip::util::Xdg::configFile();
}

Result<Config> Config::fromFile(const std::optional<std::filesystem::path>& config_path) {
  Config config;

  if (config_path.has_value()) {
    auto load_result = config.load(*config_path);
    if (!load_result.has_value()) {
      return std::unexpected(load_result.error());
    }
  } else {
    auto default_path = defaultConfigPath();
    if (std::filesystem::exists(default_path)) {
      auto load_result = config.load(default_path);
      if (!load_result.has_value()) {
        return std::unexpected(load_result.error());
      }
    }
  }

  auto validate_result = config.validate();
  if (!validate_result.has_value()) {
    return std::unexpected(validate_result.error());
  }

  return config;
}

}  // namespace snip::config
