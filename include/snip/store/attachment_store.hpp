#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "snip/common.hpp"
#include "snip/core/attachment_id.hpp"
#include "snip/store/attachment.hpp"

namespace snip::store {

// Attachment storage interface.
//
// Lookups that must yield one record fail with kNotFound when nothing
// matches and kAmbiguousMatch when more than one row matches. Stored
// fields that cannot be parsed fail with kDecodeError, storage failures
// with kDatabaseError. No partially populated Attachment is returned on
// any error.
class AttachmentStore {
 public:
  virtual ~AttachmentStore() = default;

  // Resolve a partial id (substring of the UUID text) to one full
  // attachment, payload included
  virtual Result<Attachment> resolve(const std::string& partial_id) = 0;

  // Resolve a partial id without reading the payload
  virtual Result<snip::core::AttachmentId> searchId(const std::string& partial_id) = 0;

  // Exact id, payload included
  virtual Result<Attachment> get(const snip::core::AttachmentId& id) = 0;

  // Exact id, every field except data (left empty)
  virtual Result<Attachment> getMetadata(const snip::core::AttachmentId& id) = 0;

  // Persist a new attachment
  virtual Result<void> insert(const Attachment& attachment) = 0;

  // Read a file and store it as an attachment of the given snip
  virtual Result<Attachment> addFromFile(const snip::core::SnipId& snip_id,
                                         const std::filesystem::path& source_file) = 0;

  // Remove exactly one attachment; nothing is removed on error
  virtual Result<void> remove(const snip::core::AttachmentId& id) = 0;

  // Listing (metadata only)
  virtual Result<std::vector<snip::core::AttachmentId>> listIds() = 0;
  virtual Result<std::vector<Attachment>> listForSnip(const snip::core::SnipId& snip_id) = 0;

  // Write the payload to a new file, never overwriting
  virtual Result<void> exportTo(const Attachment& attachment,
                                const std::filesystem::path& target_path) = 0;

  // Statistics
  virtual Result<size_t> totalAttachments() = 0;
  virtual Result<std::uint64_t> totalSize() = 0;
};

}  // namespace snip::store
