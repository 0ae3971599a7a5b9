#include "snip/store/attachment.hpp"

#include <algorithm>

#include "snip/util/time.hpp"

namespace snip::store {

Attachment Attachment::create() {
  Attachment attachment;
  attachment.id = snip::core::AttachmentId::generate();
  attachment.timestamp = snip::util::Time::now();
  return attachment;
}

std::string Attachment::exportFilename() const {
  // Sanitize stored name
  std::string sanitized = name;

  // Replace invalid characters
  std::replace_if(sanitized.begin(), sanitized.end(),
                  [](char c) { return c == '/' || c == '\\' || c == ':' || c == '*' ||
                               c == '?' || c == '"' || c == '<' || c == '>' || c == '|' ||
                               c == '\0'; },
                  '_');

  if (sanitized.empty() || sanitized == "." || sanitized == "..") {
    return id.toString();
  }

  // Limit length
  if (sanitized.length() > 100) {
    // Keep extension if present
    auto dot_pos = sanitized.find_last_of('.');
    if (dot_pos != std::string::npos && dot_pos > sanitized.length() - 10) {
      std::string extension = sanitized.substr(dot_pos);
      sanitized = sanitized.substr(0, 90 - extension.length()) + extension;
    } else {
      sanitized = sanitized.substr(0, 100);
    }
  }

  return sanitized;
}

}  // namespace snip::store
