#pragma once

namespace relsync::core::errors {

// Process-exit contract for release automation.
//
// 0/1/2 keep their conventional meanings. The remaining values let wrapper
// scripts tell apart a failure that never touched the remote (10, 20, 21)
// from one that happened while publishing (30, 31, 32).
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kPreconditionFailed = 10,
  kBuildFailed = 20,
  kArtifactNotFound = 21,
  kPushFailed = 30,
  kMergeConflict = 31,
  kVcsFailed = 32,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace relsync::core::errors
