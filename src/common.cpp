#include "ckpt/common.hpp"

#include <sstream>

#ifndef CKPT_VERSION_MAJOR
#define CKPT_VERSION_MAJOR 0
#endif
#ifndef CKPT_VERSION_MINOR
#define CKPT_VERSION_MINOR 1
#endif
#ifndef CKPT_VERSION_PATCH
#define CKPT_VERSION_PATCH 0
#endif

namespace ckpt {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kProcessError:
      return "Process error";
    case ErrorCode::kExternalToolError:
      return "External tool error";
    case ErrorCode::kGitError:
      return "Git error";
    case ErrorCode::kRepositoryNotFound:
      return "Repository not found";
    case ErrorCode::kRepositoryExists:
      return "Repository already exists";
    case ErrorCode::kStageFailed:
      return "Staging failed";
    case ErrorCode::kCommitFailed:
      return "Commit failed";
    case ErrorCode::kResetFailed:
      return "Rollback failed";
    case ErrorCode::kPushFailed:
      return "Push failed";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  return oss.str();
}

Version getVersion() {
  return Version{CKPT_VERSION_MAJOR, CKPT_VERSION_MINOR, CKPT_VERSION_PATCH};
}

}  // namespace ckpt
