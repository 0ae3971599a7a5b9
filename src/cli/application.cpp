#include "snip/cli/application.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "snip/store/sqlite_attachment_store.hpp"
#include "snip/util/logging.hpp"

#include "snip/cli/commands/attachment_command.hpp"

namespace snip::cli {

namespace {

// -v raises console logging to info, -vv to debug
std::string effectiveLogLevel(const std::string& configured, int verbose) {
  if (verbose >= 2) return "debug";
  if (verbose == 1) return "info";
  return configured;
}

}  // namespace

Application::Application()
    : app_("snip", "Binary attachments for snip notes") {
  app_.set_version_flag("--version", snip::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();

  app_.footer(R"(Examples:
  snip attachment add ba652e2d-b248-4bcc-b36e-c26c0d0e8002 report.pdf
  snip attachment ls --snip ba652e2d-b248-4bcc-b36e-c26c0d0e8002
  snip attachment show 9cfc5a2d
  snip attachment write 9cfc5a2d -o copy.pdf
  snip attachment rm 9cfc5a2d)");
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--db", global_options_.database, "Override database path");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<AttachmentCommand>(*this));
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

void Application::reportError(const Error& error) const {
  spdlog::debug("Command failed: [{}] {}", errorCodeToString(error.code()), error.message());

  if (global_options_.json) {
    nlohmann::json result;
    result["error"] = error.message();
    result["code"] = std::string(errorCodeToString(error.code()));
    std::cout << result.dump() << std::endl;
  } else {
    std::cerr << "Error: " << error.message() << std::endl;
  }
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  std::optional<std::filesystem::path> config_path;
  if (!global_options_.config_file.empty()) {
    config_path = global_options_.config_file;
  }

  auto config_result = snip::config::Config::fromFile(config_path);
  if (!config_result.has_value()) {
    return std::unexpected(config_result.error());
  }
  config_ = std::make_unique<snip::config::Config>(std::move(*config_result));

  // Override config with command line options
  if (!global_options_.database.empty()) {
    config_->database = global_options_.database;
  }

  snip::util::LogOptions log_options;
  log_options.level = effectiveLogLevel(config_->log_level, global_options_.verbose);
  log_options.file = config_->log_file;
  auto log_result = snip::util::initializeLogging(log_options);
  if (!log_result.has_value()) {
    return log_result;
  }

  snip::store::Database::Options db_options;
  db_options.journal_mode = config_->performance.sqlite_journal_mode;
  db_options.synchronous = config_->performance.sqlite_synchronous;
  db_options.busy_timeout_ms = config_->performance.busy_timeout_ms;

  auto database_result = snip::store::Database::open(config_->database, db_options);
  if (!database_result.has_value()) {
    return std::unexpected(database_result.error());
  }
  database_ = std::move(*database_result);

  auto schema_result = database_->createSchema();
  if (!schema_result.has_value()) {
    return schema_result;
  }

  snip::store::SqliteAttachmentStore::Config store_config;
  store_config.max_file_size = config_->attachments.max_size;
  attachment_store_ = std::make_unique<snip::store::SqliteAttachmentStore>(*database_, store_config);

  services_initialized_ = true;
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

snip::config::Config& Application::config() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *config_;
}

snip::store::AttachmentStore& Application::attachmentStore() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *attachment_store_;
}

} // namespace snip::cli
