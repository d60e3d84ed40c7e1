#include "core/errors/failure.hpp"

namespace relsync::core::errors {

std::string_view ToStableErrorCode(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kPreconditionFailure:
    return "PRECONDITION_FAILURE";
  case ErrorKind::kChannelNotFound:
    return "CHANNEL_NOT_FOUND";
  case ErrorKind::kBuildFailure:
    return "BUILD_FAILURE";
  case ErrorKind::kArtifactNotFound:
    return "ARTIFACT_NOT_FOUND";
  case ErrorKind::kMetadataFetchFailure:
    return "METADATA_FETCH_FAILURE";
  case ErrorKind::kFieldNotFound:
    return "FIELD_NOT_FOUND";
  case ErrorKind::kMergeConflict:
    return "MERGE_CONFLICT";
  case ErrorKind::kPushFailure:
    return "PUSH_FAILURE";
  case ErrorKind::kVcsFailure:
    return "VCS_FAILURE";
  case ErrorKind::kIoFailure:
    return "IO_FAILURE";
  }
  return "IO_FAILURE";
}

bool IsFatal(const ErrorKind kind) {
  return kind != ErrorKind::kMetadataFetchFailure && kind != ErrorKind::kFieldNotFound;
}

ExitCode ExitCodeFor(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kPreconditionFailure:
  case ErrorKind::kChannelNotFound:
    return ExitCode::kPreconditionFailed;
  case ErrorKind::kBuildFailure:
    return ExitCode::kBuildFailed;
  case ErrorKind::kArtifactNotFound:
    return ExitCode::kArtifactNotFound;
  case ErrorKind::kPushFailure:
    return ExitCode::kPushFailed;
  case ErrorKind::kMergeConflict:
    return ExitCode::kMergeConflict;
  case ErrorKind::kVcsFailure:
    return ExitCode::kVcsFailed;
  case ErrorKind::kMetadataFetchFailure:
  case ErrorKind::kFieldNotFound:
    return ExitCode::kSuccess;
  case ErrorKind::kIoFailure:
    return ExitCode::kFailure;
  }
  return ExitCode::kFailure;
}

std::string FormatFailure(const Failure& failure) {
  std::string text(ToStableErrorCode(failure.kind));
  if (!failure.message.empty()) {
    text += ": ";
    text += failure.message;
  }
  return text;
}

} // namespace relsync::core::errors
