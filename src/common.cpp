#include "snip/common.hpp"

#include <sstream>

namespace snip {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kFileExists:
      return "File exists";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kDatabaseError:
      return "Database error";
    case ErrorCode::kDecodeError:
      return "Decode error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAmbiguousMatch:
      return "Ambiguous match";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  return oss.str();
}

Version getVersion() {
#ifdef SNIP_VERSION_MAJOR
  return Version{SNIP_VERSION_MAJOR, SNIP_VERSION_MINOR, SNIP_VERSION_PATCH};
#else
  return Version{0, 1, 0};
#endif
}

}  // namespace snip
