#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "publish/distribution_stager.hpp"

#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using relsync::core::errors::ErrorKind;
  using relsync::core::errors::Failure;
  using relsync::publish::StageDistribution;
  using relsync::publish::StageReport;
  using relsync::tests::common::AssertEqual;
  using relsync::tests::common::Expect;
  using relsync::tests::common::ReadFileToString;
  using relsync::tests::common::WriteFileOrFail;

  const fs::path root = relsync::tests::common::CreateUniqueTempDir("relsync-stager");
  const fs::path source = root / "pack";
  const fs::path mirror = root / "mirror";

  WriteFileOrFail(source / "pack.toml", "name = \"pack\"\n");
  WriteFileOrFail(source / "index.toml", "hash-format = \"sha256\"\n");
  WriteFileOrFail(source / "mods" / "sodium.pw.toml", "name = \"Sodium\"\n");
  WriteFileOrFail(source / ".git" / "HEAD", "ref: refs/heads/source\n");

  WriteFileOrFail(mirror / ".git" / "HEAD", "ref: refs/heads/main\n");
  WriteFileOrFail(mirror / "stale.txt", "left over from last release\n");
  WriteFileOrFail(mirror / "mods" / "removed.pw.toml", "name = \"Removed\"\n");
  WriteFileOrFail(mirror / "index.toml", "old index\n");

  StageReport report;
  Failure failure;
  Expect(StageDistribution(source, mirror, report, failure),
         "staging should succeed: " + failure.message);

  Expect(!fs::exists(mirror / "stale.txt"), "stale files must be removed");
  Expect(!fs::exists(mirror / "mods" / "removed.pw.toml"), "stale nested files must be removed");
  AssertEqual(ReadFileToString(mirror / "index.toml"), "hash-format = \"sha256\"\n",
              "index replaced by source copy");
  Expect(fs::exists(mirror / "mods" / "sodium.pw.toml"), "nested layout preserved");
  AssertEqual(ReadFileToString(mirror / ".git" / "HEAD"), "ref: refs/heads/main\n",
              "destination vcs metadata untouched");
  Expect(report.copied_files == 3U, "three files copied");
  Expect(report.removed_entries == 3U, "three top-level entries removed");

  // Re-staging the same source is a full rewrite with identical content.
  Expect(StageDistribution(source, mirror, report, failure), "restaging should succeed");
  Expect(fs::exists(mirror / "pack.toml"), "restaged content present");

  // Destination that is not a working copy is rejected before any deletion.
  const fs::path plain = root / "plain";
  WriteFileOrFail(plain / "keep.txt", "keep\n");
  Expect(!StageDistribution(source, plain, report, failure), "non working copy must fail");
  Expect(failure.kind == ErrorKind::kChannelNotFound, "missing channel kind");
  Expect(fs::exists(plain / "keep.txt"), "nothing deleted on channel failure");

  // Worktree and submodule checkouts carry `.git` as a pointer file.
  const fs::path worktree = root / "worktree";
  WriteFileOrFail(worktree / ".git", "gitdir: ../mirror/.git/worktrees/release\n");
  WriteFileOrFail(worktree / "stale.txt", "old\n");
  Expect(relsync::publish::IsVcsWorkingCopy(worktree), "gitdir file marks a working copy");
  Expect(StageDistribution(source, worktree, report, failure),
         "worktree staging should succeed: " + failure.message);
  AssertEqual(ReadFileToString(worktree / ".git"), "gitdir: ../mirror/.git/worktrees/release\n",
              "gitdir pointer untouched");
  Expect(!fs::exists(worktree / "stale.txt"), "worktree stale content removed");
  Expect(fs::exists(worktree / "pack.toml"), "worktree receives the source tree");
  Expect(!relsync::publish::IsVcsWorkingCopy(plain), "plain directory is not a working copy");

  Expect(!StageDistribution(source, root / "absent", report, failure), "absent root must fail");
  Expect(failure.kind == ErrorKind::kChannelNotFound, "absent root is a missing channel");

  Expect(!StageDistribution(root / "no-source", mirror, report, failure), "absent source fails");
  Expect(failure.kind == ErrorKind::kPreconditionFailure, "absent source is a precondition");
  Expect(fs::exists(mirror / "pack.toml"), "nothing deleted on source failure");

  // Overlapping trees would delete the source while copying it.
  WriteFileOrFail(mirror / "sub" / "file.txt", "x\n");
  Expect(!StageDistribution(mirror / "sub", mirror, report, failure), "nested source must fail");
  Expect(failure.kind == ErrorKind::kPreconditionFailure, "overlap is a precondition");
  Expect(fs::exists(mirror / "sub" / "file.txt"), "nothing deleted on overlap");

  relsync::tests::common::RemovePathBestEffort(root);
  std::cout << "distribution_stager_smoke: ok\n";
  return 0;
}
