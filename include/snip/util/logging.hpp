#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "snip/common.hpp"

namespace snip::util {

struct LogOptions {
  std::string level = "warn";                    // spdlog level name
  std::optional<std::filesystem::path> file;     // Rotating file sink, if set
};

// Install the default spdlog logger: stderr color sink plus optional file sink
Result<void> initializeLogging(const LogOptions& options);

}  // namespace snip::util
