#include "snip/cli/commands/attachment_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "snip/util/time.hpp"

namespace snip::cli {

namespace {

nlohmann::json toJson(const snip::store::Attachment& attachment) {
  nlohmann::json result;
  result["id"] = attachment.id.toString();
  result["snip_id"] = attachment.parent_id.toString();
  result["name"] = attachment.name;
  result["size"] = attachment.size;
  result["timestamp"] = snip::util::Time::toRfc3339Nano(attachment.timestamp);
  return result;
}

void printRow(const snip::store::Attachment& attachment) {
  std::cout << attachment.id.toString() << "  "
            << std::setw(10) << attachment.size << "  "
            << snip::util::Time::toRfc3339Nano(attachment.timestamp) << "  "
            << attachment.name << std::endl;
}

}  // namespace

AttachmentCommand::AttachmentCommand(Application& app) : app_(app) {
}

Result<int> AttachmentCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::Add:
      return executeAdd(options);
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Show:
      return executeShow(options);
    case SubCommand::Remove:
      return executeRemove(options);
    case SubCommand::Write:
      return executeWrite(options);
    case SubCommand::Stats:
      return executeStats(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void AttachmentCommand::setupCommand(CLI::App* cmd) {
  auto add_cmd = cmd->add_subcommand("add", "Attach files to a snip");
  add_cmd->add_option("snip_id", snip_id_, "Full UUID of the snip")->required();
  add_cmd->add_option("files", files_, "Files to attach")->required();
  add_cmd->callback([this]() { sub_command_ = SubCommand::Add; });

  auto list_cmd = cmd->add_subcommand("ls", "List attachments");
  list_cmd->add_option("--snip", snip_id_, "Only attachments of this snip (full UUID)");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto show_cmd = cmd->add_subcommand("show", "Show attachment metadata");
  show_cmd->add_option("id", attachment_id_, "Attachment ID (can be partial)")->required();
  show_cmd->callback([this]() { sub_command_ = SubCommand::Show; });

  auto remove_cmd = cmd->add_subcommand("rm", "Remove attachments");
  remove_cmd->add_option("ids", attachment_ids_, "Attachment IDs (can be partial)")->required();
  remove_cmd->callback([this]() { sub_command_ = SubCommand::Remove; });

  auto write_cmd = cmd->add_subcommand("write", "Write attachment data to a file");
  write_cmd->add_option("id", attachment_id_, "Attachment ID (can be partial)")->required();
  write_cmd->add_option("-o,--output", output_path_, "Output file (default: stored name)");
  write_cmd->callback([this]() { sub_command_ = SubCommand::Write; });

  auto stats_cmd = cmd->add_subcommand("stats", "Show attachment count and total size");
  stats_cmd->callback([this]() { sub_command_ = SubCommand::Stats; });

  // Require exactly one subcommand
  cmd->require_subcommand(1, 1);
}

Result<int> AttachmentCommand::executeAdd(const GlobalOptions& options) {
  auto snip_id = snip::core::SnipId::fromString(snip_id_);
  if (!snip_id.has_value()) {
    return std::unexpected(snip_id.error());
  }

  auto& store = app_.attachmentStore();
  nlohmann::json added = nlohmann::json::array();

  for (const auto& file : files_) {
    auto attachment = store.addFromFile(*snip_id, file);
    if (!attachment.has_value()) {
      return std::unexpected(makeError(attachment.error().code(),
                                       "Failed to attach " + file + ": " + attachment.error().message()));
    }
    spdlog::info("Attached {} ({} bytes) as {}", file, attachment->size, attachment->id.toString());

    if (options.json) {
      added.push_back(toJson(*attachment));
    } else if (!options.quiet) {
      std::cout << "Attached " << attachment->name << " (" << attachment->size << " bytes)"
                << " as " << attachment->id.toString() << std::endl;
    }
  }

  if (options.json) {
    std::cout << added.dump(2) << std::endl;
  }
  return 0;
}

Result<int> AttachmentCommand::executeList(const GlobalOptions& options) {
  auto& store = app_.attachmentStore();
  std::vector<snip::store::Attachment> attachments;

  if (!snip_id_.empty()) {
    auto snip_id = snip::core::SnipId::fromString(snip_id_);
    if (!snip_id.has_value()) {
      return std::unexpected(snip_id.error());
    }
    auto result = store.listForSnip(*snip_id);
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
    attachments = std::move(*result);
  } else {
    auto ids = store.listIds();
    if (!ids.has_value()) {
      return std::unexpected(ids.error());
    }
    // Metadata only, payloads stay in the database
    for (const auto& id : *ids) {
      auto attachment = store.getMetadata(id);
      if (!attachment.has_value()) {
        return std::unexpected(attachment.error());
      }
      attachments.push_back(std::move(*attachment));
    }
  }

  if (options.json) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& attachment : attachments) {
      result.push_back(toJson(attachment));
    }
    std::cout << result.dump(2) << std::endl;
    return 0;
  }

  if (attachments.empty()) {
    if (!options.quiet) {
      std::cout << "No attachments found." << std::endl;
    }
    return 0;
  }

  for (const auto& attachment : attachments) {
    printRow(attachment);
  }
  return 0;
}

Result<int> AttachmentCommand::executeShow(const GlobalOptions& options) {
  auto& store = app_.attachmentStore();

  auto id = store.searchId(attachment_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto attachment = store.getMetadata(*id);
  if (!attachment.has_value()) {
    return std::unexpected(attachment.error());
  }

  if (options.json) {
    std::cout << toJson(*attachment).dump(2) << std::endl;
  } else {
    std::cout << "uuid:      " << attachment->id.toString() << std::endl;
    std::cout << "snip:      " << attachment->parent_id.toString() << std::endl;
    std::cout << "name:      " << attachment->name << std::endl;
    std::cout << "size:      " << attachment->size << std::endl;
    std::cout << "timestamp: " << snip::util::Time::toRfc3339Nano(attachment->timestamp) << std::endl;
  }
  return 0;
}

Result<int> AttachmentCommand::executeRemove(const GlobalOptions& options) {
  auto& store = app_.attachmentStore();
  nlohmann::json removed = nlohmann::json::array();

  for (const auto& partial_id : attachment_ids_) {
    auto id = store.searchId(partial_id);
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }

    auto remove_result = store.remove(*id);
    if (!remove_result.has_value()) {
      return std::unexpected(remove_result.error());
    }
    spdlog::info("Removed attachment {}", id->toString());

    if (options.json) {
      removed.push_back(id->toString());
    } else if (!options.quiet) {
      std::cout << "Removed attachment " << id->toString() << std::endl;
    }
  }

  if (options.json) {
    nlohmann::json result;
    result["removed"] = removed;
    std::cout << result.dump() << std::endl;
  }
  return 0;
}

Result<int> AttachmentCommand::executeWrite(const GlobalOptions& options) {
  auto& store = app_.attachmentStore();

  auto attachment = store.resolve(attachment_id_);
  if (!attachment.has_value()) {
    return std::unexpected(attachment.error());
  }

  std::filesystem::path target = output_path_.empty()
      ? std::filesystem::path(attachment->exportFilename())
      : std::filesystem::path(output_path_);

  auto export_result = store.exportTo(*attachment, target);
  if (!export_result.has_value()) {
    return std::unexpected(export_result.error());
  }

  if (options.json) {
    nlohmann::json result = toJson(*attachment);
    result["path"] = target.string();
    std::cout << result.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Wrote " << attachment->data.size() << " bytes to " << target.string() << std::endl;
  }
  return 0;
}

Result<int> AttachmentCommand::executeStats(const GlobalOptions& options) {
  auto& store = app_.attachmentStore();

  auto count = store.totalAttachments();
  if (!count.has_value()) {
    return std::unexpected(count.error());
  }

  auto size = store.totalSize();
  if (!size.has_value()) {
    return std::unexpected(size.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["attachments"] = *count;
    result["total_size"] = *size;
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << "attachments: " << *count << std::endl;
    std::cout << "total size:  " << *size << " bytes" << std::endl;
  }
  return 0;
}

} // namespace snip::cli
