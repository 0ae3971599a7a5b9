#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "snip/cli/application.hpp"
#include "snip/store/attachment.hpp"

namespace snip::cli {

/**
 * @brief Attachment management command
 *
 * Supports subcommands:
 * - add: Import files as attachments of a snip
 * - ls: List attachments, all or of one snip
 * - show: Show metadata of one attachment
 * - rm: Remove attachments
 * - write: Write attachment data to a file
 * - stats: Count and total size
 */
class AttachmentCommand : public Command {
public:
  explicit AttachmentCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "attachment"; }
  std::string description() const override { return "Manage snip attachments"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  enum class SubCommand {
    Add,
    List,
    Show,
    Remove,
    Write,
    Stats
  };

  SubCommand sub_command_ = SubCommand::List;

  // Command-specific options
  std::string snip_id_;
  std::vector<std::string> files_;
  std::vector<std::string> attachment_ids_;
  std::string attachment_id_;
  std::string output_path_;

  // Subcommand implementations
  Result<int> executeAdd(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeShow(const GlobalOptions& options);
  Result<int> executeRemove(const GlobalOptions& options);
  Result<int> executeWrite(const GlobalOptions& options);
  Result<int> executeStats(const GlobalOptions& options);
};

} // namespace snip::cli
