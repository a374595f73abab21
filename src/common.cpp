#include "objid/common.hpp"

#include <sstream>

namespace objid {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kInvalidId:
      return "Invalid id";
    case ErrorCode::kTypeError:
      return "Type error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Error::describe() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;
  return oss.str();
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
#ifdef OBJID_VERSION_MAJOR
  return Version{OBJID_VERSION_MAJOR, OBJID_VERSION_MINOR, OBJID_VERSION_PATCH, ""};
#else
  return Version{0, 1, 0, "dev"};
#endif
}

}  // namespace objid
