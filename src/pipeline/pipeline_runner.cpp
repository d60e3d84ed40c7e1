#include "pipeline/pipeline_runner.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "manifest/manifest_store.hpp"
#include "publish/distribution_stager.hpp"
#include "version/http_version_lookup.hpp"
#include "version/semver.hpp"
#include "version/version_resolver.hpp"

#include <utility>

namespace relsync::pipeline {

namespace {

namespace fs = std::filesystem;
using core::errors::ErrorKind;
using core::errors::ExitCode;
using core::errors::MakeFailure;

constexpr std::size_t kIndexOutputTailLines = 20U;

} // namespace

struct PipelineRunner::RunContext {
  RunContext(const PipelineOptions& run_options, PipelineSummary& run_summary)
      : options(run_options), summary(run_summary) {}

  const PipelineOptions& options;
  PipelineSummary& summary;
  PipelineConfig config;
  publish::PublishMode mode = publish::PublishMode::kDirectMirror;
  core::process::ICommandRunner* runner = nullptr;
  std::unique_ptr<manifest::ManifestStore> manifest;
  version::VersionSpec recorded;
  std::string recorded_artifact_version;

  bool publishing() const {
    return options.publish && !options.bump_only;
  }

  bool upgrading() const {
    return options.upgrade || options.explicit_primary.has_value();
  }
};

std::string DefaultCommitMessage(const version::VersionSpec& versions) {
  return "release " + versions.primary + " (" + versions.secondary + ")";
}

PipelineRunner::PipelineRunner(PipelineDependencies dependencies, core::logging::Logger& logger)
    : dependencies_(std::move(dependencies)), logger_(logger) {}

bool PipelineRunner::Fail(RunContext& context, const char* stage, core::errors::Failure failure,
                          const std::string& state) {
  context.summary.failed_stage = stage;
  context.summary.failed_state = state;
  const std::string_view code = core::errors::ToStableErrorCode(failure.kind);
  if (state.empty()) {
    logger_.Error("release pipeline failed",
                  {{"failed_stage", stage}, {"error_code", code}, {"error", failure.message}});
  } else {
    logger_.Error("release pipeline failed", {{"failed_stage", stage},
                                              {"error_code", code},
                                              {"state", state},
                                              {"error", failure.message}});
  }
  context.summary.failure = std::move(failure);
  return false;
}

ExitCode PipelineRunner::Run(const PipelineOptions& options, PipelineSummary& summary) {
  summary = PipelineSummary{};
  const std::size_t warnings_before = logger_.WarningCount();

  RunContext context(options, summary);
  context.runner = dependencies_.runner != nullptr ? dependencies_.runner : &shell_runner_;

  std::string error;
  bool config_loaded = false;
  {
    core::logging::Logger::ContextField stage_field(logger_, "stage", kStageConfig);
    config_loaded = LoadPipelineConfig(options.config_path, context.config, error) ||
                    Fail(context, kStageConfig, MakeFailure(ErrorKind::kPreconditionFailure, error));
  }
  if (!config_loaded) {
    summary.warnings = logger_.WarningCount() - warnings_before;
    return core::errors::ExitCodeFor(summary.failure->kind);
  }
  context.mode = options.mode_override.value_or(context.config.publish.mode);
  logger_.Info("release pipeline started",
               {{"config", context.config.config_path.string()},
                {"manifest", context.config.manifest_path.string()},
                {"upgrade", context.upgrading() ? "true" : "false"},
                {"build", options.build ? "true" : "false"},
                {"publish", context.publishing() ? publish::ToString(context.mode) : "off"}});

  const auto run_stage = [&](const char* stage, bool (PipelineRunner::*step)(RunContext&)) {
    core::logging::Logger::ContextField stage_field(logger_, "stage", stage);
    return (this->*step)(context);
  };
  const bool ok = run_stage(kStagePreflight, &PipelineRunner::Preflight) &&
                  run_stage(kStageResolve, &PipelineRunner::Resolve) &&
                  run_stage(kStageManifest, &PipelineRunner::UpdateVersions) &&
                  run_stage(kStageBuild, &PipelineRunner::BuildAndRecordArtifact) &&
                  run_stage(kStageIndex, &PipelineRunner::RefreshIndex) &&
                  run_stage(kStageStage, &PipelineRunner::Stage) &&
                  run_stage(kStagePublish, &PipelineRunner::Publish);
  summary.warnings = logger_.WarningCount() - warnings_before;
  if (!ok) {
    return core::errors::ExitCodeFor(summary.failure->kind);
  }

  logger_.Info("release pipeline complete",
               {{"primary", summary.versions.primary},
                {"secondary", summary.versions.secondary},
                {"publish_result",
                 summary.publish_result ? publish::ToString(*summary.publish_result) : "skipped"},
                {"warnings", std::to_string(summary.warnings)}});
  return ExitCode::kSuccess;
}

bool PipelineRunner::Preflight(RunContext& context) {
  const PipelineConfig& config = context.config;
  const auto precondition = [&](ErrorKind kind, std::string message) {
    return Fail(context, kStagePreflight, MakeFailure(kind, std::move(message)));
  };

  if (context.options.direct && context.publishing() &&
      context.mode == publish::PublishMode::kDirectMirror) {
    return precondition(ErrorKind::kPreconditionFailure,
                        "--direct only applies to promote mode, but publish mode is mirror");
  }

  if (context.options.build && !config.build.configured) {
    return precondition(ErrorKind::kPreconditionFailure,
                        "--build requested but the config has no 'build' section");
  }

  context.manifest = std::make_unique<manifest::ManifestStore>(config.manifest_path, logger_);
  std::string error;
  if (!context.manifest->Load(error)) {
    return precondition(ErrorKind::kPreconditionFailure, error);
  }

  if (context.options.build) {
    if (!core::IsExistingDirectory(config.build.working_dir)) {
      return precondition(ErrorKind::kPreconditionFailure,
                          "build directory not found: " + config.build.working_dir.string());
    }
    if (!config.build.version_manifest.empty() &&
        !core::IsExistingRegularFile(config.build.version_manifest)) {
      return precondition(ErrorKind::kPreconditionFailure,
                          "version manifest not found: " +
                              config.build.version_manifest.string());
    }
  }

  if (!context.options.bump_only && !config.index.refresh_command.empty() &&
      !core::IsExistingDirectory(config.index.source_dir)) {
    return precondition(ErrorKind::kPreconditionFailure,
                        "index source directory not found: " + config.index.source_dir.string());
  }

  if (context.publishing()) {
    if (context.mode == publish::PublishMode::kDirectMirror) {
      if (config.publish.distribution_root.empty()) {
        return precondition(ErrorKind::kPreconditionFailure,
                            "config field 'publish.distribution_root' is required for mirror "
                            "mode");
      }
      if (!publish::IsVcsWorkingCopy(config.publish.distribution_root)) {
        return precondition(ErrorKind::kChannelNotFound,
                            "distribution root is not a working copy: " +
                                config.publish.distribution_root.string());
      }
      if (!core::IsExistingDirectory(config.index.source_dir)) {
        return precondition(ErrorKind::kPreconditionFailure,
                            "index source directory not found: " +
                                config.index.source_dir.string());
      }
    } else if (!core::IsExistingDirectory(config.repo_root)) {
      return precondition(ErrorKind::kPreconditionFailure,
                          "repository root not found: " + config.repo_root.string());
    }
  }

  if (!context.manifest->ReadField(config.fields.primary_version, context.recorded.primary,
                                   error)) {
    logger_.Debug("recorded primary version unavailable", {{"error", error}});
  }
  if (!context.manifest->ReadField(config.fields.secondary_version, context.recorded.secondary,
                                   error)) {
    logger_.Debug("recorded secondary version unavailable", {{"error", error}});
  }
  if (!context.manifest->ReadField(config.fields.artifact_version,
                                   context.recorded_artifact_version, error)) {
    context.recorded_artifact_version.clear();
  }
  context.summary.versions = context.recorded;
  return true;
}

bool PipelineRunner::Resolve(RunContext& context) {
  if (!context.upgrading()) {
    return true;
  }

  const VersionLookupConfig& lookup_config = context.config.version_lookup;
  std::unique_ptr<version::IVersionLookup> http_lookup;
  version::UnconfiguredVersionLookup unconfigured;
  version::IVersionLookup* source = dependencies_.version_lookup;
  if (source == nullptr && !lookup_config.url.empty()) {
    http_lookup =
        std::make_unique<version::HttpVersionLookup>(lookup_config.url, lookup_config.timeout);
    source = http_lookup.get();
  }

  version::ResolveResult resolved;
  if (source == nullptr) {
    resolved = version::ResolveVersions(context.options.explicit_primary,
                                        context.recorded.primary, context.recorded.secondary,
                                        unconfigured);
  } else {
    version::RetryPolicy policy;
    policy.max_attempts = lookup_config.max_attempts;
    policy.base_delay = lookup_config.retry_base_delay;
    version::RetryingVersionLookup retrying(*source, policy, logger_, dependencies_.sleep);
    resolved = version::ResolveVersions(context.options.explicit_primary,
                                        context.recorded.primary, context.recorded.secondary,
                                        retrying);
  }

  if (resolved.warning.has_value()) {
    logger_.Warn("keeping recorded secondary version",
                 {{"error_code", core::errors::ToStableErrorCode(resolved.warning->kind)},
                  {"secondary", resolved.spec.secondary},
                  {"error", resolved.warning->message}});
  }
  logger_.Info("versions resolved", {{"primary", resolved.spec.primary},
                                     {"secondary", resolved.spec.secondary}});
  context.summary.versions = resolved.spec;
  return true;
}

bool PipelineRunner::UpdateVersions(RunContext& context) {
  if (!context.upgrading()) {
    return true;
  }

  const ManifestFieldPaths& fields = context.config.fields;
  const version::VersionSpec& versions = context.summary.versions;
  if (!versions.primary.empty()) {
    context.manifest->UpdateField(fields.primary_version,
                                  manifest::FieldValue::String(versions.primary));
  }
  if (!versions.secondary.empty()) {
    context.manifest->UpdateField(fields.secondary_version,
                                  manifest::FieldValue::String(versions.secondary));
  }

  std::string error;
  if (context.manifest->dirty() && !context.manifest->Save(error)) {
    return Fail(context, kStageManifest, MakeFailure(ErrorKind::kIoFailure, error));
  }
  return true;
}

bool PipelineRunner::BuildAndRecordArtifact(RunContext& context) {
  if (!context.options.build) {
    return true;
  }

  const BuildConfig& build = context.config.build;
  artifacts::BuildRequest request;
  request.working_dir = build.working_dir;
  request.command = build.command;
  request.output_path = build.output_path;
  request.publish_path = build.publish_path;
  request.version_manifest = build.version_manifest;
  request.version_field = build.version_field;

  artifacts::ArtifactBuilder builder(*context.runner, logger_);
  artifacts::BuildArtifact artifact;
  core::errors::Failure failure;
  if (!builder.Build(request, artifact, failure)) {
    return Fail(context, kStageBuild, std::move(failure));
  }

  version::SemanticVersion previous;
  version::SemanticVersion current;
  if (!artifact.declared_version.empty() &&
      version::ParseSemanticVersion(context.recorded_artifact_version, previous) &&
      version::ParseSemanticVersion(artifact.declared_version, current) &&
      !version::IsStrictlyNewer(current, previous)) {
    logger_.Warn("artifact version is not newer than the recorded one, clients will not "
                 "self-update",
                 {{"recorded", context.recorded_artifact_version},
                  {"declared", artifact.declared_version}});
  }

  const ManifestFieldPaths& fields = context.config.fields;
  context.manifest->UpdateField(fields.artifact_size,
                                manifest::FieldValue::Integer(artifact.size_bytes));
  context.manifest->UpdateField(fields.artifact_hash, manifest::FieldValue::String(artifact.sha256));
  if (!artifact.declared_version.empty()) {
    context.manifest->UpdateField(fields.artifact_version,
                                  manifest::FieldValue::String(artifact.declared_version));
  }

  std::string error;
  if (context.manifest->dirty() && !context.manifest->Save(error)) {
    return Fail(context, kStageManifest, MakeFailure(ErrorKind::kIoFailure, error));
  }
  context.summary.artifact = std::move(artifact);
  return true;
}

bool PipelineRunner::RefreshIndex(RunContext& context) {
  const IndexConfig& index = context.config.index;
  if (context.options.bump_only || index.refresh_command.empty()) {
    return true;
  }

  logger_.Info("refreshing index", {{"source_dir", index.source_dir.string()},
                                    {"command", index.refresh_command}});
  core::process::CommandResult result;
  std::string error;
  if (!context.runner->RunShell(index.refresh_command, index.source_dir, result, error)) {
    return Fail(context, kStageIndex,
                MakeFailure(ErrorKind::kBuildFailure, "unable to launch index refresh: " + error));
  }
  if (result.exit_code != 0) {
    return Fail(context, kStageIndex,
                MakeFailure(ErrorKind::kBuildFailure,
                            "index refresh exited with code " + std::to_string(result.exit_code) +
                                "\n" +
                                core::process::TailLines(result.output, kIndexOutputTailLines)));
  }
  return true;
}

bool PipelineRunner::Stage(RunContext& context) {
  if (!context.publishing() || context.mode != publish::PublishMode::kDirectMirror) {
    return true;
  }

  publish::StageReport report;
  core::errors::Failure failure;
  if (!publish::StageDistribution(context.config.index.source_dir,
                                  context.config.publish.distribution_root, report, failure)) {
    return Fail(context, kStageStage, std::move(failure));
  }
  logger_.Info("distribution staged",
               {{"distribution_root", context.config.publish.distribution_root.string()},
                {"removed_entries", std::to_string(report.removed_entries)},
                {"copied_files", std::to_string(report.copied_files)}});
  return true;
}

bool PipelineRunner::Publish(RunContext& context) {
  if (!context.publishing()) {
    logger_.Info("publish skipped");
    return true;
  }

  const PublishConfig& publish_config = context.config.publish;
  const fs::path working_copy = context.mode == publish::PublishMode::kDirectMirror
                                    ? publish_config.distribution_root
                                    : context.config.repo_root;
  std::unique_ptr<publish::IVcsClient> vcs =
      dependencies_.vcs_factory
          ? dependencies_.vcs_factory(working_copy)
          : std::make_unique<publish::GitClient>(*context.runner, working_copy);
  if (!vcs) {
    return Fail(context, kStagePublish,
                MakeFailure(ErrorKind::kVcsFailure,
                            "no version-control client for " + working_copy.string()));
  }

  publish::PublishRequest request;
  request.mode = context.mode;
  request.commit_message = context.options.commit_message.empty()
                               ? DefaultCommitMessage(context.summary.versions)
                               : context.options.commit_message;
  request.remote = publish_config.remote;
  request.primary_branch = publish_config.primary_branch;
  request.direct = context.options.direct;
  context.summary.commit_message = request.commit_message;

  publish::PublishCoordinator coordinator(*vcs, logger_);
  publish::PublishResult result = publish::PublishResult::kNoChanges;
  core::errors::Failure failure;
  if (!coordinator.Publish(request, result, failure)) {
    const std::string state = context.mode == publish::PublishMode::kBranchPromotion
                                  ? coordinator.promotion_report().failed_transition
                                  : std::string{};
    return Fail(context, kStagePublish, std::move(failure), state);
  }
  context.summary.publish_result = result;
  return true;
}

} // namespace relsync::pipeline
