#include "snip/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace snip::util {

Result<void> initializeLogging(const LogOptions& options) {
  auto level = spdlog::level::from_str(options.level);
  if (level == spdlog::level::off && options.level != "off") {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Unknown log level: " + options.level));
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sinks.push_back(console_sink);

    if (options.file.has_value()) {
      auto parent = options.file->parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.file->string(), 1024 * 1024 * 5, 3);  // 5MB files, 3 backups
      sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("snip", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    logger->set_level(level);

    spdlog::set_default_logger(logger);

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Failed to set up logging: " + std::string(e.what())));
  }

  return {};
}

}  // namespace snip::util
