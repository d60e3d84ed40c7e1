#include "../common/assertions.hpp"
#include "../common/fake_command_runner.hpp"
#include "../common/fake_vcs_client.hpp"
#include "../common/fake_version_lookup.hpp"
#include "../common/temp_dir.hpp"
#include "artifacts/sha256.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/pipeline_runner.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using relsync::core::errors::ErrorKind;
using relsync::core::errors::ExitCode;
using relsync::pipeline::PipelineDependencies;
using relsync::pipeline::PipelineOptions;
using relsync::pipeline::PipelineRunner;
using relsync::pipeline::PipelineSummary;
using relsync::publish::PublishResult;
using relsync::tests::common::AssertContains;
using relsync::tests::common::AssertEqual;
using relsync::tests::common::AssertNotContains;
using relsync::tests::common::CreateUniqueTempDir;
using relsync::tests::common::Expect;
using relsync::tests::common::FakeCommandRunner;
using relsync::tests::common::FakeVcsClient;
using relsync::tests::common::FakeVersionLookup;
using relsync::tests::common::ReadFileToString;
using relsync::tests::common::RemovePathBestEffort;
using relsync::tests::common::WriteFileOrFail;

constexpr const char* kPackManifest = R"(name = "Example Pack"
pack-format = "packwiz:1.1.0"

[versions]
minecraft = "1.21.1"
fabric = "0.16.0"

[updater]
version = "1.0.0"
size = 0
sha256 = ""
)";

constexpr const char* kArtifactBytes = "PK\x03\x04 updater bytes";

// The pipeline owns the VCS client it gets from the factory; tests keep the
// fake and hand out a forwarding view of it.
class ForwardingVcsClient final : public relsync::publish::IVcsClient {
public:
  explicit ForwardingVcsClient(FakeVcsClient& target) : target_(target) {}

  bool Status(std::vector<std::string>& changes, std::string& error) override {
    return target_.Status(changes, error);
  }
  bool AddAll(std::string& error) override {
    return target_.AddAll(error);
  }
  bool Commit(const std::string& message, std::string& error) override {
    return target_.Commit(message, error);
  }
  bool Push(const std::string& remote, const std::string& branch, std::string& error) override {
    return target_.Push(remote, branch, error);
  }
  bool Checkout(const std::string& branch, std::string& error) override {
    return target_.Checkout(branch, error);
  }
  bool Merge(const std::string& source, const std::string& message, std::string& error) override {
    return target_.Merge(source, message, error);
  }
  bool AbortMerge(std::string& error) override {
    return target_.AbortMerge(error);
  }
  bool CurrentBranch(std::string& branch, std::string& error) override {
    return target_.CurrentBranch(branch, error);
  }

private:
  FakeVcsClient& target_;
};

struct Fixture {
  explicit Fixture(const char* name) : root(CreateUniqueTempDir(name)) {
    WriteFileOrFail(root / "pack" / "pack.toml", kPackManifest);
    WriteFileOrFail(root / "pack" / "index.toml", "hash-format = \"sha256\"\n");
    WriteFileOrFail(root / "updater" / "version.json", "{\n  \"version\": \"1.1.0\"\n}\n");
    fs::create_directories(root / "mirror" / ".git");
    WriteFileOrFail(root / "mirror" / "stale.toml", "old\n");

    runner.handler = [this](const FakeCommandRunner::Call& call,
                            relsync::core::process::CommandResult& result, std::string& error) {
      (void)error;
      if (call.command_line == "./gradlew build") {
        if (fail_build) {
          result.exit_code = 1;
          result.output = "> Task :compileJava FAILED\nBUILD FAILED in 3s\n";
          return true;
        }
        if (produce_artifact) {
          WriteFileOrFail(call.working_dir / "build" / "libs" / "updater.jar", kArtifactBytes);
        }
      }
      return true;
    };
    dependencies.runner = &runner;
    dependencies.version_lookup = &lookup;
    dependencies.vcs_factory = [this](const fs::path& working_copy) {
      vcs_working_copy = working_copy;
      return std::make_unique<ForwardingVcsClient>(vcs);
    };
    dependencies.sleep = [](std::chrono::milliseconds) {};
  }

  ~Fixture() {
    RemovePathBestEffort(root);
  }

  void WriteConfig(const std::string& publish_section, std::uint32_t max_attempts = 1U) {
    WriteFileOrFail(root / "relsync.json",
                    std::string("{\n") + "  \"manifest_path\": \"pack/pack.toml\",\n" +
                        "  \"version_lookup\": {\"max_attempts\": " +
                        std::to_string(max_attempts) + ", \"retry_base_delay_ms\": 5},\n" +
                        "  \"build\": {\n" + "    \"working_dir\": \"updater\",\n" +
                        "    \"command\": \"./gradlew build\",\n" +
                        "    \"output_path\": \"build/libs/updater.jar\",\n" +
                        "    \"publish_path\": \"pack/updater.jar\",\n" +
                        "    \"version_manifest\": \"updater/version.json\",\n" +
                        "    \"version_field\": \"version\"\n" + "  },\n" +
                        "  \"index\": {\"refresh_command\": \"packwiz refresh\"},\n" +
                        "  \"publish\": " + publish_section + "\n" + "}\n");
  }

  ExitCode Run(const PipelineOptions& options) {
    PipelineOptions with_config = options;
    with_config.config_path = root / "relsync.json";
    PipelineRunner pipeline_runner(dependencies, logger);
    return pipeline_runner.Run(with_config, summary);
  }

  std::string Manifest() const {
    return ReadFileToString(root / "pack" / "pack.toml");
  }

  fs::path root;
  std::ostringstream log_sink;
  relsync::core::logging::Logger logger{relsync::core::logging::LogLevel::kDebug, log_sink};
  FakeCommandRunner runner;
  FakeVersionLookup lookup;
  FakeVcsClient vcs;
  fs::path vcs_working_copy;
  PipelineDependencies dependencies;
  PipelineSummary summary;
  bool fail_build = false;
  bool produce_artifact = true;
};

constexpr const char* kMirrorPublish = R"({"mode": "mirror", "distribution_root": "mirror"})";
constexpr const char* kPromotePublish = R"({"mode": "promote"})";

void TestLookupFailureFallsBackWithOneWarning() {
  Fixture f("relsync-pipeline-fallback");
  f.WriteConfig(kMirrorPublish);
  f.lookup.script = {FakeVersionLookup::Failure("HTTP 503")};

  PipelineOptions options;
  options.explicit_primary = "1.21.4";
  options.bump_only = true;
  options.publish = false;
  Expect(f.Run(options) == ExitCode::kSuccess, "fallback run should succeed");

  AssertEqual(f.summary.versions.primary, "1.21.4", "explicit primary applied");
  AssertEqual(f.summary.versions.secondary, "0.16.0", "recorded secondary kept");
  Expect(f.summary.warnings == 1U, "exactly one warning for the fallback");
  Expect(f.lookup.calls == 1U, "single attempt configured");

  const std::string manifest = f.Manifest();
  AssertContains(manifest, "minecraft = \"1.21.4\"");
  AssertContains(manifest, "fabric = \"0.16.0\"");
  AssertContains(manifest, "pack-format = \"packwiz:1.1.0\"");
  Expect(f.runner.calls.empty(), "bump runs no external commands");
  Expect(f.vcs.journal.empty(), "bump never touches version control");
  AssertContains(f.log_sink.str(), "stage=\"resolve\" msg=\"keeping recorded secondary version\"");
  AssertContains(f.log_sink.str(), "error_code=\"METADATA_FETCH_FAILURE\"");
}

void TestDefaultRetriesStillWarnOnce() {
  Fixture f("relsync-pipeline-default-retries");
  WriteFileOrFail(f.root / "relsync.json",
                  R"({"manifest_path": "pack/pack.toml", "publish": {"mode": "mirror"}})");
  f.lookup.script = {FakeVersionLookup::Failure("HTTP 503")};

  PipelineOptions options;
  options.upgrade = true;
  options.bump_only = true;
  options.publish = false;
  Expect(f.Run(options) == ExitCode::kSuccess, "exhausted lookup falls back");
  Expect(f.lookup.calls == 3U, "default policy uses three attempts");
  AssertEqual(f.summary.versions.secondary, "0.16.0", "recorded secondary kept");
  Expect(f.summary.warnings == 1U, "retries and fallback count as one degradation");
  AssertContains(f.log_sink.str(),
                 "level=INFO run_id=\"-\" stage=\"resolve\" msg=\"version lookup attempt failed\"");
  AssertNotContains(f.log_sink.str(),
                    "level=WARN run_id=\"-\" stage=\"resolve\" msg=\"version lookup attempt failed\"");
}

void TestRetriesBeforeResolving() {
  Fixture f("relsync-pipeline-retry");
  f.WriteConfig(kMirrorPublish, 3U);
  f.lookup.script = {FakeVersionLookup::Failure("connection reset"),
                     FakeVersionLookup::Success({{"0.16.10", false}, {"0.16.9", true}})};

  PipelineOptions options;
  options.upgrade = true;
  options.bump_only = true;
  options.publish = false;
  Expect(f.Run(options) == ExitCode::kSuccess, "retried lookup should succeed");
  Expect(f.lookup.calls == 2U, "second attempt succeeds");
  AssertEqual(f.summary.versions.secondary, "0.16.9", "latest stable selected");
  AssertEqual(f.summary.versions.primary, "1.21.1", "recorded primary kept without override");
  AssertContains(f.Manifest(), "fabric = \"0.16.9\"");
}

void TestBuildRecordsArtifactAndPublishesMirror() {
  Fixture f("relsync-pipeline-build");
  f.WriteConfig(kMirrorPublish);
  f.lookup.script = {FakeVersionLookup::Success({{"0.16.10", true}})};
  f.vcs.branch = "main";
  f.vcs.pending_changes = {" M pack.toml", " M updater.jar"};

  PipelineOptions options;
  options.explicit_primary = "1.21.4";
  options.build = true;
  const ExitCode exit_code = f.Run(options);
  Expect(exit_code == ExitCode::kSuccess,
         "release should succeed: " +
             (f.summary.failure ? f.summary.failure->message : std::string("no failure")));

  const std::string expected_hash = relsync::artifacts::ComputeSha256(kArtifactBytes);
  const std::string manifest = f.Manifest();
  AssertContains(manifest, "minecraft = \"1.21.4\"");
  AssertContains(manifest, "fabric = \"0.16.10\"");
  AssertContains(manifest, "version = \"1.1.0\"");
  AssertContains(manifest, "size = " + std::to_string(std::string(kArtifactBytes).size()) + "\n");
  AssertContains(manifest, "sha256 = \"" + expected_hash + "\"");

  Expect(f.summary.artifact.has_value(), "artifact recorded in summary");
  AssertEqual(f.summary.artifact->sha256, expected_hash, "summary hash");
  Expect(fs::exists(f.root / "pack" / "updater.jar"), "artifact copied to publish path");

  Expect(f.runner.calls.size() == 2U, "build then index refresh");
  AssertEqual(f.runner.calls[1].command_line, "packwiz refresh", "index refresh command");
  Expect(f.runner.calls[1].working_dir == f.root / "pack", "index refresh runs in pack dir");

  Expect(!fs::exists(f.root / "mirror" / "stale.toml"), "stale mirror content removed");
  Expect(fs::exists(f.root / "mirror" / ".git"), "mirror metadata kept");
  AssertContains(ReadFileToString(f.root / "mirror" / "pack.toml"), "minecraft = \"1.21.4\"");
  Expect(f.vcs_working_copy == f.root / "mirror", "mirror publishes the distribution root");

  Expect(f.summary.publish_result == PublishResult::kPublished, "published");
  AssertEqual(f.summary.commit_message, "release 1.21.4 (0.16.10)", "default commit message");
  Expect(f.vcs.commits == 1 && f.vcs.pushes == 1, "one commit and one push");
}

void TestStaleArtifactVersionOnlyWarns() {
  Fixture f("relsync-pipeline-stale-artifact");
  f.WriteConfig(kMirrorPublish);
  WriteFileOrFail(f.root / "updater" / "version.json", "{\"version\": \"0.9.5\"}\n");

  PipelineOptions options;
  options.build = true;
  options.publish = false;
  Expect(f.Run(options) == ExitCode::kSuccess, "stale artifact version is not fatal");
  Expect(f.summary.warnings == 1U, "one warning for the version regression");
  AssertContains(f.log_sink.str(), "artifact version is not newer");
  AssertContains(f.Manifest(), "version = \"0.9.5\"");
}

void TestBuildFailureLeavesManifestUntouched() {
  Fixture f("relsync-pipeline-build-fail");
  f.WriteConfig(kMirrorPublish);
  f.fail_build = true;

  PipelineOptions options;
  options.build = true;
  const ExitCode exit_code = f.Run(options);
  Expect(exit_code == ExitCode::kBuildFailed, "build failure maps to exit 20");
  AssertEqual(f.summary.failed_stage, "build", "failed stage");
  Expect(f.summary.failure && f.summary.failure->kind == ErrorKind::kBuildFailure,
         "BuildFailure reported");
  AssertContains(f.summary.failure->message, "BUILD FAILED");
  AssertEqual(f.Manifest(), kPackManifest, "manifest byte-identical after build failure");
  Expect(f.vcs.journal.empty(), "nothing published after build failure");
  Expect(fs::exists(f.root / "mirror" / "stale.toml"), "mirror untouched");

  Fixture missing("relsync-pipeline-artifact-missing");
  missing.WriteConfig(kMirrorPublish);
  missing.produce_artifact = false;
  Expect(missing.Run(options) == ExitCode::kArtifactNotFound, "missing artifact maps to exit 21");
  AssertEqual(missing.Manifest(), kPackManifest, "manifest untouched without artifact");
}

void TestMissingChannelFailsBeforeAnyMutation() {
  Fixture f("relsync-pipeline-channel");
  f.WriteConfig(R"({"mode": "mirror", "distribution_root": "nowhere"})");
  f.lookup.script = {FakeVersionLookup::Success({{"0.16.10", true}})};

  PipelineOptions options;
  options.explicit_primary = "1.21.4";
  options.build = true;
  Expect(f.Run(options) == ExitCode::kPreconditionFailed, "missing channel maps to exit 10");
  AssertEqual(f.summary.failed_stage, "preflight", "failed in preflight");
  Expect(f.summary.failure->kind == ErrorKind::kChannelNotFound, "ChannelNotFound reported");
  AssertEqual(f.Manifest(), kPackManifest, "manifest untouched");
  Expect(f.runner.calls.empty(), "no build started");
  Expect(f.lookup.calls == 0U, "no lookup before preflight passes");
}

void TestDirectRejectedForConfiguredMirror() {
  Fixture f("relsync-pipeline-direct-mirror");
  f.WriteConfig(kMirrorPublish);
  f.lookup.script = {FakeVersionLookup::Success({{"0.16.10", true}})};

  PipelineOptions options;
  options.upgrade = true;
  options.direct = true;
  Expect(f.Run(options) == ExitCode::kPreconditionFailed, "--direct with mirror config fails");
  AssertEqual(f.summary.failed_stage, "preflight", "rejected in preflight");
  AssertContains(f.summary.failure->message, "--direct");
  AssertEqual(f.Manifest(), kPackManifest, "manifest untouched");
  Expect(f.lookup.calls == 0U, "no lookup after a rejected invocation");
  Expect(f.vcs.journal.empty(), "version control untouched");
}

void TestWorktreeMirrorIsAChannel() {
  Fixture f("relsync-pipeline-worktree");
  f.WriteConfig(R"({"mode": "mirror", "distribution_root": "worktree"})");
  WriteFileOrFail(f.root / "worktree" / ".git", "gitdir: ../mirror/.git/worktrees/dist\n");
  f.vcs.branch = "dist";
  f.vcs.pending_changes = {"?? pack.toml"};

  Expect(f.Run(PipelineOptions{}) == ExitCode::kSuccess, "worktree distribution publishes");
  Expect(fs::exists(f.root / "worktree" / "pack.toml"), "worktree staged");
  Expect(f.vcs_working_copy == f.root / "worktree", "worktree is the publish working copy");
  Expect(f.vcs.pushes == 1, "worktree branch pushed");
}

void TestPromotionConflictReportsState() {
  Fixture f("relsync-pipeline-promote");
  f.WriteConfig(kPromotePublish);
  f.vcs.pending_changes = {" M pack/pack.toml"};
  f.vcs.fail_merge = true;

  PipelineOptions options;
  options.commit_message = "update pack";
  const ExitCode exit_code = f.Run(options);
  Expect(exit_code == ExitCode::kMergeConflict, "merge conflict maps to exit 31");
  AssertEqual(f.summary.failed_stage, "publish", "failed stage");
  AssertEqual(f.summary.failed_state, "Committed->MergedToMain", "failed state reported");
  AssertEqual(f.vcs.branch, "dev", "working branch restored");
  Expect(f.vcs_working_copy == f.root, "promotion runs in repository root");
  AssertContains(f.log_sink.str(), "state=\"Committed->MergedToMain\"");
}

void TestMirrorWithoutChangesSucceeds() {
  Fixture f("relsync-pipeline-nochange");
  f.WriteConfig(kMirrorPublish);
  f.vcs.branch = "main";

  const ExitCode exit_code = f.Run(PipelineOptions{});
  Expect(exit_code == ExitCode::kSuccess, "unchanged distribution is not an error");
  Expect(f.summary.publish_result == PublishResult::kNoChanges, "NoChanges reported");
  Expect(f.vcs.commits == 0 && f.vcs.pushes == 0, "nothing committed or pushed");
  AssertEqual(f.Manifest(), kPackManifest, "manifest untouched without upgrade");
  AssertNotContains(f.log_sink.str(), "level=ERROR");
}

void TestMissingConfigIsPrecondition() {
  Fixture f("relsync-pipeline-noconfig");
  Expect(f.Run(PipelineOptions{}) == ExitCode::kPreconditionFailed, "missing config fails");
  AssertEqual(f.summary.failed_stage, "config", "failed stage");
  AssertContains(f.summary.failure->message, "config file not found");
}

} // namespace

int main() {
  TestLookupFailureFallsBackWithOneWarning();
  TestDefaultRetriesStillWarnOnce();
  TestRetriesBeforeResolving();
  TestBuildRecordsArtifactAndPublishesMirror();
  TestStaleArtifactVersionOnlyWarns();
  TestBuildFailureLeavesManifestUntouched();
  TestMissingChannelFailsBeforeAnyMutation();
  TestDirectRejectedForConfiguredMirror();
  TestWorktreeMirrorIsAChannel();
  TestPromotionConflictReportsState();
  TestMirrorWithoutChangesSucceeds();
  TestMissingConfigIsPrecondition();
  std::cout << "pipeline_runner_smoke: ok\n";
  return 0;
}
