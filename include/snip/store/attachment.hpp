#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "snip/core/attachment_id.hpp"

namespace snip::store {

// Binary data attached to a snip
struct Attachment {
  snip::core::AttachmentId id;       // UUID of the attachment
  std::string data;                  // Raw bytes, binary safe
  std::uint64_t size = 0;            // Stored byte length, not derived from data
  snip::core::SnipId parent_id;      // Snip this is attached to
  std::chrono::system_clock::time_point timestamp;
  std::string name;                  // Display name, may be empty

  // Fresh id and current time, empty data and name, zero size
  static Attachment create();

  // File name to use when writing the data out (sanitized name, or the id)
  std::string exportFilename() const;
};

}  // namespace snip::store
