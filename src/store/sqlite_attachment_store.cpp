#include "snip/store/sqlite_attachment_store.hpp"

#include <algorithm>
#include <fstream>
#include <optional>

namespace snip::store {

// SQL queries
namespace sql {

// Column order shared by every attachment SELECT; data is optional last
constexpr const char* kSelectFullLike = R"(
SELECT uuid, snip_uuid, timestamp, name, size, data
  FROM snip_attachment
 WHERE uuid LIKE ? ESCAPE '\'
)";

constexpr const char* kSelectFullExact = R"(
SELECT uuid, snip_uuid, timestamp, name, size, data
  FROM snip_attachment
 WHERE uuid = ?
)";

constexpr const char* kSelectMetadataExact = R"(
SELECT uuid, snip_uuid, timestamp, name, size
  FROM snip_attachment
 WHERE uuid = ?
)";

constexpr const char* kSelectMetadataBySnip = R"(
SELECT uuid, snip_uuid, timestamp, name, size
  FROM snip_attachment
 WHERE snip_uuid = ?
)";

constexpr const char* kSearchIdLike = R"(
SELECT uuid FROM snip_attachment WHERE uuid LIKE ? ESCAPE '\' LIMIT 2
)";

// Two rows are enough to tell 0, 1 and more than 1 apart
constexpr const char* kProbeExact = R"(
SELECT uuid FROM snip_attachment WHERE uuid = ? LIMIT 2
)";

constexpr const char* kDeleteExact = R"(
DELETE FROM snip_attachment WHERE uuid = ?
)";

constexpr const char* kInsert = R"(
INSERT INTO snip_attachment (uuid, snip_uuid, timestamp, name, data, size)
VALUES (?, ?, ?, ?, ?, ?)
)";

constexpr const char* kSelectAllIds = R"(
SELECT uuid FROM snip_attachment
)";

constexpr const char* kCount = R"(
SELECT COUNT(*) FROM snip_attachment
)";

constexpr const char* kSelectAllSizes = R"(
SELECT size FROM snip_attachment
)";

}  // namespace sql

namespace {

Error notFound(const std::string& lookup) {
  return makeError(ErrorCode::kNotFound, "No attachment matches: " + lookup);
}

Error ambiguous(const std::string& lookup) {
  return makeError(ErrorCode::kAmbiguousMatch,
                   "Multiple attachments match: " + lookup + " (use a longer id)");
}

}  // namespace

SqliteAttachmentStore::SqliteAttachmentStore(Database& database)
    : SqliteAttachmentStore(database, Config{}) {
}

SqliteAttachmentStore::SqliteAttachmentStore(Database& database, Config config)
    : database_(database), config_(std::move(config)) {
}

std::string SqliteAttachmentStore::substringPattern(const std::string& partial_id) {
  std::string pattern;
  pattern.reserve(partial_id.size() + 2);
  pattern += '%';
  for (char c : partial_id) {
    if (c == '%' || c == '_' || c == '\\') {
      pattern += '\\';
    }
    pattern += c;
  }
  pattern += '%';
  return pattern;
}

codec::AttachmentRow SqliteAttachmentStore::readRow(const Statement& stmt, bool with_data) {
  codec::AttachmentRow row;
  row.uuid = stmt.columnText(0);
  row.snip_uuid = stmt.columnText(1);
  row.timestamp = stmt.columnText(2);
  row.name = stmt.columnText(3);
  row.size = stmt.columnText(4);
  if (with_data) {
    row.data = stmt.columnBlob(5);
  }
  return row;
}

Result<Attachment> SqliteAttachmentStore::fetchSingle(Statement& stmt, bool with_data,
                                                      const std::string& lookup) {
  auto has_row = stmt.step();
  if (!has_row.has_value()) {
    return std::unexpected(has_row.error());
  }
  if (!*has_row) {
    return std::unexpected(notFound(lookup));
  }

  // Column buffers are invalidated by the next step, so copy first
  auto row = readRow(stmt, with_data);

  has_row = stmt.step();
  if (!has_row.has_value()) {
    return std::unexpected(has_row.error());
  }
  if (*has_row) {
    return std::unexpected(ambiguous(lookup));
  }

  return codec::decodeRow(std::move(row));
}

Result<Attachment> SqliteAttachmentStore::resolve(const std::string& partial_id) {
  auto stmt = database_.prepare(sql::kSelectFullLike);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  auto bind_result = stmt->bindText(1, substringPattern(partial_id));
  if (!bind_result.has_value()) {
    return std::unexpected(bind_result.error());
  }

  return fetchSingle(*stmt, true, partial_id);
}

Result<snip::core::AttachmentId> SqliteAttachmentStore::searchId(const std::string& partial_id) {
  auto stmt = database_.prepare(sql::kSearchIdLike);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  auto bind_result = stmt->bindText(1, substringPattern(partial_id));
  if (!bind_result.has_value()) {
    return std::unexpected(bind_result.error());
  }

  std::optional<std::string> match;
  while (true) {
    auto has_row = stmt->step();
    if (!has_row.has_value()) {
      return std::unexpected(has_row.error());
    }
    if (!*has_row) {
      break;
    }
    if (match.has_value()) {
      return std::unexpected(ambiguous(partial_id));
    }
    match = stmt->columnText(0);
  }

  if (!match.has_value()) {
    return std::unexpected(notFound(partial_id));
  }

  return codec::decodeId(*match, "attachment uuid");
}

Result<Attachment> SqliteAttachmentStore::get(const snip::core::AttachmentId& id) {
  auto stmt = database_.prepare(sql::kSelectFullExact);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  std::string id_str = id.toString();
  auto bind_result = stmt->bindText(1, id_str);
  if (!bind_result.has_value()) {
    return std::unexpected(bind_result.error());
  }

  return fetchSingle(*stmt, true, id_str);
}

Result<Attachment> SqliteAttachmentStore::getMetadata(const snip::core::AttachmentId& id) {
  auto stmt = database_.prepare(sql::kSelectMetadataExact);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  std::string id_str = id.toString();
  auto bind_result = stmt->bindText(1, id_str);
  if (!bind_result.has_value()) {
    return std::unexpected(bind_result.error());
  }

  return fetchSingle(*stmt, false, id_str);
}

Result<void> SqliteAttachmentStore::insert(const Attachment& attachment) {
  auto stmt = database_.prepare(sql::kInsert);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  Result<void> bind_results[] = {
    stmt->bindText(1, attachment.id.toString()),
    stmt->bindText(2, attachment.parent_id.toString()),
    stmt->bindText(3, codec::encodeTimestamp(attachment.timestamp)),
    stmt->bindText(4, attachment.name),
    stmt->bindBlob(5, attachment.data),
    stmt->bindText(6, codec::encodeSize(attachment.size)),
  };
  for (const auto& result : bind_results) {
    if (!result.has_value()) {
      return result;
    }
  }

  return stmt->execute();
}

Result<Attachment> SqliteAttachmentStore::addFromFile(const snip::core::SnipId& snip_id,
                                                      const std::filesystem::path& source_file) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source_file, ec)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Not a regular file: " + source_file.string()));
  }

  auto file_size = std::filesystem::file_size(source_file, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get file size: " + ec.message()));
  }
  if (file_size > config_.max_file_size) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "File too large: " + std::to_string(file_size) + " bytes"));
  }

  std::ifstream file(source_file, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot open file: " + source_file.string()));
  }

  std::string content(file_size, '\0');
  file.read(content.data(), static_cast<std::streamsize>(file_size));
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Read failed: " + source_file.string()));
  }

  auto attachment = Attachment::create();
  attachment.parent_id = snip_id;
  attachment.name = source_file.filename().string();
  attachment.size = content.size();
  attachment.data = std::move(content);

  auto insert_result = insert(attachment);
  if (!insert_result.has_value()) {
    return std::unexpected(insert_result.error());
  }

  return attachment;
}

Result<void> SqliteAttachmentStore::remove(const snip::core::AttachmentId& id) {
  std::string id_str = id.toString();

  // Existence and uniqueness probe; the statement is released before the DELETE
  {
    auto probe = database_.prepare(sql::kProbeExact);
    if (!probe.has_value()) {
      return std::unexpected(probe.error());
    }

    auto bind_result = probe->bindText(1, id_str);
    if (!bind_result.has_value()) {
      return bind_result;
    }

    int count = 0;
    while (true) {
      auto has_row = probe->step();
      if (!has_row.has_value()) {
        return std::unexpected(has_row.error());
      }
      if (!*has_row) {
        break;
      }
      ++count;
    }

    if (count == 0) {
      return std::unexpected(notFound(id_str));
    }
    if (count > 1) {
      return std::unexpected(makeError(ErrorCode::kAmbiguousMatch,
                                       "Attachment id is not unique in the store: " + id_str));
    }
  }

  auto stmt = database_.prepare(sql::kDeleteExact);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  auto bind_result = stmt->bindText(1, id_str);
  if (!bind_result.has_value()) {
    return bind_result;
  }

  auto delete_result = stmt->execute();
  if (!delete_result.has_value()) {
    return delete_result;
  }

  // Removed by another writer after the probe
  if (database_.changes() == 0) {
    return std::unexpected(notFound(id_str));
  }

  return {};
}

Result<std::vector<snip::core::AttachmentId>> SqliteAttachmentStore::listIds() {
  auto stmt = database_.prepare(sql::kSelectAllIds);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  std::vector<snip::core::AttachmentId> ids;
  while (true) {
    auto has_row = stmt->step();
    if (!has_row.has_value()) {
      return std::unexpected(has_row.error());
    }
    if (!*has_row) {
      break;
    }

    auto id = codec::decodeId(stmt->columnText(0), "attachment uuid");
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
    ids.push_back(*id);
  }

  return ids;
}

Result<std::vector<Attachment>> SqliteAttachmentStore::listForSnip(const snip::core::SnipId& snip_id) {
  auto stmt = database_.prepare(sql::kSelectMetadataBySnip);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  auto bind_result = stmt->bindText(1, snip_id.toString());
  if (!bind_result.has_value()) {
    return std::unexpected(bind_result.error());
  }

  std::vector<Attachment> attachments;
  while (true) {
    auto has_row = stmt->step();
    if (!has_row.has_value()) {
      return std::unexpected(has_row.error());
    }
    if (!*has_row) {
      break;
    }

    auto attachment = codec::decodeRow(readRow(*stmt, false));
    if (!attachment.has_value()) {
      return std::unexpected(attachment.error());
    }
    attachments.push_back(std::move(*attachment));
  }

  // Sort by creation time
  std::sort(attachments.begin(), attachments.end(),
            [](const Attachment& a, const Attachment& b) {
              return a.timestamp < b.timestamp;
            });

  return attachments;
}

Result<void> SqliteAttachmentStore::exportTo(const Attachment& attachment,
                                             const std::filesystem::path& target_path) {
  std::error_code ec;
  if (std::filesystem::exists(target_path, ec)) {
    return std::unexpected(makeError(ErrorCode::kFileExists,
                                     "Refusing to overwrite existing file: " + target_path.string()));
  }

  std::ofstream file(target_path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create file: " + target_path.string()));
  }

  file.write(attachment.data.data(), static_cast<std::streamsize>(attachment.data.size()));
  file.close();
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Write failed: " + target_path.string()));
  }

  return {};
}

Result<size_t> SqliteAttachmentStore::totalAttachments() {
  auto stmt = database_.prepare(sql::kCount);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  auto has_row = stmt->step();
  if (!has_row.has_value()) {
    return std::unexpected(has_row.error());
  }
  if (!*has_row) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Count query returned no rows"));
  }

  return static_cast<size_t>(stmt->columnInt64(0));
}

Result<std::uint64_t> SqliteAttachmentStore::totalSize() {
  auto stmt = database_.prepare(sql::kSelectAllSizes);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  std::uint64_t total = 0;
  while (true) {
    auto has_row = stmt->step();
    if (!has_row.has_value()) {
      return std::unexpected(has_row.error());
    }
    if (!*has_row) {
      break;
    }

    auto size = codec::decodeSize(stmt->columnText(0));
    if (!size.has_value()) {
      return std::unexpected(size.error());
    }
    total += *size;
  }

  return total;
}

}  // namespace snip::store
