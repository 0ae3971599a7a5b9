#pragma once

#include <string>
#include <string_view>

#include <boost/uuid/uuid.hpp>

#include "snip/common.hpp"

namespace snip::core {

// UUID identifying an attachment or a snip.
// Canonical text form is 36 lowercase characters (8-4-4-4-12).
class AttachmentId {
 public:
  // Create new random (version 4) UUID
  static AttachmentId generate();

  // Parse canonical UUID text
  static Result<AttachmentId> fromString(std::string_view str);

  // Default constructor creates the nil UUID
  AttachmentId() = default;

  // Get canonical string representation
  std::string toString() const;

  // Comparison operators
  bool operator==(const AttachmentId& other) const noexcept;
  bool operator!=(const AttachmentId& other) const noexcept;
  bool operator<(const AttachmentId& other) const noexcept;

  // Nil UUID (all zero bits)
  bool isNil() const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const AttachmentId& id) const noexcept;
  };

 private:
  explicit AttachmentId(boost::uuids::uuid id);

  // Validate canonical 8-4-4-4-12 hex layout
  static bool isValidFormat(std::string_view str);

  boost::uuids::uuid id_{};
};

// Snips are addressed by the same UUID type
using SnipId = AttachmentId;

}  // namespace snip::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<snip::core::AttachmentId> : snip::core::AttachmentId::Hash {};
}  // namespace std
