#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "snip/common.hpp"
#include "snip/config/config.hpp"
#include "snip/store/attachment_store.hpp"
#include "snip/store/database.hpp"

namespace snip::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string database;        // --db: Override database path
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 *
 * Owns the configuration, the database connection and the stores built
 * on it. Services are created lazily, after argument parsing.
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  snip::config::Config& config();
  snip::store::AttachmentStore& attachmentStore();

private:
  void setupGlobalOptions();
  void setupCommands();
  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeServices();
  void reportError(const Error& error) const;

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  // Services
  std::unique_ptr<snip::config::Config> config_;
  std::unique_ptr<snip::store::Database> database_;
  std::unique_ptr<snip::store::AttachmentStore> attachment_store_;
  bool services_initialized_ = false;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace snip::cli
