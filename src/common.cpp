#include "tuid/common.hpp"

#include <sstream>

namespace tuid {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kEncodingError:
      return "Encoding error";
    case ErrorCode::kDecodingError:
      return "Decoding error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef TUID_VERSION_MAJOR
  return Version{TUID_VERSION_MAJOR, TUID_VERSION_MINOR, TUID_VERSION_PATCH, ""};
#else
  // Fallback when the build does not inject version information
  return Version{1, 0, 0, "dev"};
#endif
}

}  // namespace tuid
