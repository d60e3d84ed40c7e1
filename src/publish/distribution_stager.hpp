#pragma once

#include "core/errors/failure.hpp"

#include <cstddef>
#include <filesystem>

namespace relsync::publish {

// Name of the version-control metadata entry that staging never touches.
inline constexpr const char* kVcsMetadataDirName = ".git";

// True when `root` is a directory holding `.git`, either as a metadata
// directory or as the `gitdir:` pointer file of a worktree or submodule.
bool IsVcsWorkingCopy(const std::filesystem::path& root);

struct StageReport {
  std::size_t removed_entries = 0;
  std::size_t copied_files = 0;
};

// Mirror-replace: every top-level entry of `destination_root` except `.git`
// is removed, then `source_tree` is copied in with its relative layout.
// `.git` entries inside `source_tree` are not copied.
//
// All preconditions are checked before the first deletion:
//  - IsVcsWorkingCopy(destination_root) (else kChannelNotFound)
//  - `source_tree` is a directory (else kPreconditionFailure)
//  - neither path contains the other (else kPreconditionFailure)
bool StageDistribution(const std::filesystem::path& source_tree,
                       const std::filesystem::path& destination_root, StageReport& report,
                       core::errors::Failure& failure);

} // namespace relsync::publish
