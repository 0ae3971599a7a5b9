#pragma once

#include <cstdint>

#include "snip/store/attachment_store.hpp"
#include "snip/store/attachment_codec.hpp"
#include "snip/store/database.hpp"

namespace snip::store {

// SQLite-backed attachment storage over a caller-owned connection.
//
// Checks and writes are separate statements with no transaction around
// them: a concurrent writer may change the table between the existence
// probe and the DELETE in remove().
class SqliteAttachmentStore : public AttachmentStore {
 public:
  struct Config {
    std::uintmax_t max_file_size = 100 * 1024 * 1024;  // 100MB default limit
  };

  explicit SqliteAttachmentStore(Database& database);
  SqliteAttachmentStore(Database& database, Config config);
  ~SqliteAttachmentStore() override = default;

  // AttachmentStore interface
  Result<Attachment> resolve(const std::string& partial_id) override;
  Result<snip::core::AttachmentId> searchId(const std::string& partial_id) override;
  Result<Attachment> get(const snip::core::AttachmentId& id) override;
  Result<Attachment> getMetadata(const snip::core::AttachmentId& id) override;

  Result<void> insert(const Attachment& attachment) override;
  Result<Attachment> addFromFile(const snip::core::SnipId& snip_id,
                                 const std::filesystem::path& source_file) override;
  Result<void> remove(const snip::core::AttachmentId& id) override;

  Result<std::vector<snip::core::AttachmentId>> listIds() override;
  Result<std::vector<Attachment>> listForSnip(const snip::core::SnipId& snip_id) override;

  Result<void> exportTo(const Attachment& attachment,
                        const std::filesystem::path& target_path) override;

  Result<size_t> totalAttachments() override;
  Result<std::uint64_t> totalSize() override;

  const Config& config() const { return config_; }

  // Wrap user text as a literal LIKE substring pattern
  static std::string substringPattern(const std::string& partial_id);

 private:
  // Step a statement expecting exactly one row and decode it.
  // Stops at the second row without decoding anything.
  Result<Attachment> fetchSingle(Statement& stmt, bool with_data, const std::string& lookup);

  static codec::AttachmentRow readRow(const Statement& stmt, bool with_data);

  Database& database_;
  Config config_;
};

}  // namespace snip::store
