#include "snip/store/attachment_codec.hpp"

#include <charconv>

#include "snip/util/time.hpp"

namespace snip::store::codec {

Result<std::uint64_t> decodeSize(std::string_view text) {
  std::uint64_t value = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();

  // from_chars accepts neither sign nor whitespace, so "-1" and " 1" fail here
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (text.empty() || ec != std::errc() || ptr != end) {
    return std::unexpected(makeError(ErrorCode::kDecodeError,
                                     "Invalid attachment size: '" + std::string(text) + "'"));
  }
  return value;
}

Result<snip::core::AttachmentId> decodeId(std::string_view text, std::string_view column) {
  auto id = snip::core::AttachmentId::fromString(text);
  if (!id.has_value()) {
    return std::unexpected(makeError(ErrorCode::kDecodeError,
                                     "Invalid " + std::string(column) + ": '" + std::string(text) + "'"));
  }
  return *id;
}

Result<std::chrono::system_clock::time_point> decodeTimestamp(std::string_view text) {
  auto timestamp = snip::util::Time::fromRfc3339(std::string(text));
  if (!timestamp.has_value()) {
    return std::unexpected(makeError(ErrorCode::kDecodeError,
                                     "Invalid attachment timestamp: '" + std::string(text) + "'"));
  }
  return *timestamp;
}

Result<Attachment> decodeRow(AttachmentRow row) {
  Attachment attachment;

  auto id = decodeId(row.uuid, "attachment uuid");
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }
  attachment.id = *id;

  auto parent_id = decodeId(row.snip_uuid, "snip uuid");
  if (!parent_id.has_value()) {
    return std::unexpected(parent_id.error());
  }
  attachment.parent_id = *parent_id;

  auto size = decodeSize(row.size);
  if (!size.has_value()) {
    return std::unexpected(size.error());
  }
  attachment.size = *size;

  auto timestamp = decodeTimestamp(row.timestamp);
  if (!timestamp.has_value()) {
    return std::unexpected(timestamp.error());
  }
  attachment.timestamp = *timestamp;

  attachment.name = std::move(row.name);
  if (row.data.has_value()) {
    attachment.data = std::move(*row.data);
  }

  return attachment;
}

std::string encodeSize(std::uint64_t size) {
  return std::to_string(size);
}

std::string encodeTimestamp(std::chrono::system_clock::time_point timestamp) {
  return snip::util::Time::toRfc3339Nano(timestamp);
}

}  // namespace snip::store::codec
