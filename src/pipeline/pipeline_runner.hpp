#pragma once

#include "artifacts/artifact_builder.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/failure.hpp"
#include "core/process/command_runner.hpp"
#include "pipeline/pipeline_config.hpp"
#include "publish/publish_coordinator.hpp"
#include "publish/vcs_client.hpp"
#include "version/retrying_version_lookup.hpp"
#include "version/version_lookup.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace relsync::core::logging {
class Logger;
}

namespace relsync::pipeline {

// Stage names reported on failure.
inline constexpr const char* kStageConfig = "config";
inline constexpr const char* kStagePreflight = "preflight";
inline constexpr const char* kStageResolve = "resolve";
inline constexpr const char* kStageManifest = "manifest";
inline constexpr const char* kStageBuild = "build";
inline constexpr const char* kStageIndex = "index";
inline constexpr const char* kStageStage = "stage";
inline constexpr const char* kStagePublish = "publish";

struct PipelineOptions {
  std::filesystem::path config_path = kDefaultConfigFileName;
  std::optional<std::string> explicit_primary;
  bool upgrade = false;
  bool build = false;
  bool publish = true;
  std::optional<publish::PublishMode> mode_override;
  bool direct = false;
  // Empty selects "release <primary> (<secondary>)".
  std::string commit_message;
  // Skip index refresh, staging and publishing. Used by `relsync bump`.
  bool bump_only = false;
};

// Collaborators the pipeline reaches the outside world through. Unset members
// get production implementations built from the config.
struct PipelineDependencies {
  using VcsFactory =
      std::function<std::unique_ptr<publish::IVcsClient>(const std::filesystem::path&)>;

  core::process::ICommandRunner* runner = nullptr;
  version::IVersionLookup* version_lookup = nullptr;
  VcsFactory vcs_factory;
  version::RetryingVersionLookup::SleepFn sleep;
};

struct PipelineSummary {
  version::VersionSpec versions;
  std::optional<artifacts::BuildArtifact> artifact;
  std::optional<publish::PublishResult> publish_result;
  std::string commit_message;
  // Set on fatal failure.
  std::string failed_stage;
  std::string failed_state;
  std::optional<core::errors::Failure> failure;
  std::size_t warnings = 0;
};

std::string DefaultCommitMessage(const version::VersionSpec& versions);

// Runs config -> preflight -> resolve -> manifest -> build -> index -> stage
// -> publish. Every check that can be made before touching the manifest,
// the working tree or the distribution channel runs in preflight.
class PipelineRunner {
public:
  PipelineRunner(PipelineDependencies dependencies, core::logging::Logger& logger);

  core::errors::ExitCode Run(const PipelineOptions& options, PipelineSummary& summary);

private:
  struct RunContext;

  bool Preflight(RunContext& context);
  bool Resolve(RunContext& context);
  bool UpdateVersions(RunContext& context);
  bool BuildAndRecordArtifact(RunContext& context);
  bool RefreshIndex(RunContext& context);
  bool Stage(RunContext& context);
  bool Publish(RunContext& context);

  bool Fail(RunContext& context, const char* stage, core::errors::Failure failure,
            const std::string& state = {});

  PipelineDependencies dependencies_;
  core::logging::Logger& logger_;
  core::process::ShellCommandRunner shell_runner_;
};

} // namespace relsync::pipeline
