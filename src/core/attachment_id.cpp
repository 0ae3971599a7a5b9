#include "snip/core/attachment_id.hpp"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/functional/hash.hpp>

namespace snip::core {

namespace {

constexpr size_t kUuidLength = 36;

bool isHexDigit(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool isHyphenPosition(size_t pos) {
  return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

}  // namespace

AttachmentId AttachmentId::generate() {
  static thread_local boost::uuids::random_generator gen;
  return AttachmentId(gen());
}

Result<AttachmentId> AttachmentId::fromString(std::string_view str) {
  if (!isValidFormat(str)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid UUID format: " + std::string(str)));
  }

  boost::uuids::string_generator parse;
  return AttachmentId(parse(str.begin(), str.end()));
}

std::string AttachmentId::toString() const {
  return boost::uuids::to_string(id_);
}

bool AttachmentId::operator==(const AttachmentId& other) const noexcept {
  return id_ == other.id_;
}

bool AttachmentId::operator!=(const AttachmentId& other) const noexcept {
  return !(*this == other);
}

bool AttachmentId::operator<(const AttachmentId& other) const noexcept {
  return id_ < other.id_;
}

bool AttachmentId::isNil() const noexcept {
  return id_.is_nil();
}

std::size_t AttachmentId::Hash::operator()(const AttachmentId& id) const noexcept {
  return boost::hash_range(id.id_.begin(), id.id_.end());
}

AttachmentId::AttachmentId(boost::uuids::uuid id) : id_(id) {}

bool AttachmentId::isValidFormat(std::string_view str) {
  if (str.length() != kUuidLength) {
    return false;
  }

  for (size_t i = 0; i < str.length(); ++i) {
    if (isHyphenPosition(i)) {
      if (str[i] != '-') return false;
    } else if (!isHexDigit(str[i])) {
      return false;
    }
  }

  return true;
}

}  // namespace snip::core
