#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "snip/common.hpp"
#include "snip/core/attachment_id.hpp"
#include "snip/store/attachment.hpp"

namespace snip::store::codec {

// Column values of one snip_attachment row as the store returns them.
// data is absent for metadata-only queries.
struct AttachmentRow {
  std::string uuid;
  std::string snip_uuid;
  std::string timestamp;
  std::string name;
  std::string size;
  std::optional<std::string> data;
};

// Text to type conversions; failures are kDecodeError
Result<std::uint64_t> decodeSize(std::string_view text);
Result<snip::core::AttachmentId> decodeId(std::string_view text, std::string_view column);
Result<std::chrono::system_clock::time_point> decodeTimestamp(std::string_view text);

// Whole row; the record is rejected if any field fails to decode
Result<Attachment> decodeRow(AttachmentRow row);

// Type to text conversions for the write path
std::string encodeSize(std::uint64_t size);
std::string encodeTimestamp(std::chrono::system_clock::time_point timestamp);

}  // namespace snip::store::codec
