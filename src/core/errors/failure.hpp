#pragma once

#include "core/errors/exit_codes.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace relsync::core::errors {

// Failure taxonomy shared by every pipeline stage.
//
// kMetadataFetchFailure and kFieldNotFound are degradations: they are logged
// and the run continues with a fallback. Every other kind aborts the run.
enum class ErrorKind {
  kPreconditionFailure,
  kChannelNotFound,
  kBuildFailure,
  kArtifactNotFound,
  kMetadataFetchFailure,
  kFieldNotFound,
  kMergeConflict,
  kPushFailure,
  kVcsFailure,
  kIoFailure,
};

struct Failure {
  ErrorKind kind = ErrorKind::kIoFailure;
  std::string message;
};

// Grep-friendly code, e.g. "MERGE_CONFLICT".
std::string_view ToStableErrorCode(ErrorKind kind);

bool IsFatal(ErrorKind kind);

ExitCode ExitCodeFor(ErrorKind kind);

// "<STABLE_CODE>: <message>"
std::string FormatFailure(const Failure& failure);

inline Failure MakeFailure(ErrorKind kind, std::string message) {
  Failure failure;
  failure.kind = kind;
  failure.message = std::move(message);
  return failure;
}

} // namespace relsync::core::errors
