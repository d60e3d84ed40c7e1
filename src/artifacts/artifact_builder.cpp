#include "artifacts/artifact_builder.hpp"

#include "artifacts/sha256.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "manifest/manifest_store.hpp"

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

namespace relsync::artifacts {

namespace {

using core::errors::ErrorKind;
using core::errors::MakeFailure;

constexpr std::size_t kBuildOutputTailLines = 20U;

std::filesystem::path ResolveAgainst(const std::filesystem::path& base,
                                     const std::filesystem::path& path) {
  return path.is_absolute() ? path : base / path;
}

bool SamePath(const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
  std::error_code ec;
  const bool equivalent = std::filesystem::equivalent(lhs, rhs, ec);
  return !ec && equivalent;
}

} // namespace

bool MeasureArtifact(const std::filesystem::path& path, BuildArtifact& artifact,
                     std::string& error) {
  std::error_code ec;
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    error = "unable to stat artifact '" + path.string() + "': " + ec.message();
    return false;
  }
  std::string digest;
  if (!ComputeFileSha256(path, digest, error)) {
    return false;
  }
  artifact.path = path;
  artifact.size_bytes = static_cast<std::uint64_t>(size);
  artifact.sha256 = std::move(digest);
  return true;
}

bool ArtifactBuilder::Build(const BuildRequest& request, BuildArtifact& artifact,
                            core::errors::Failure& failure) {
  if (!core::IsExistingDirectory(request.working_dir)) {
    failure = MakeFailure(ErrorKind::kPreconditionFailure,
                          "build directory not found: " + request.working_dir.string());
    return false;
  }
  if (request.command.empty()) {
    failure = MakeFailure(ErrorKind::kPreconditionFailure, "build command is empty");
    return false;
  }
  if (!request.version_manifest.empty() &&
      !core::IsExistingRegularFile(request.version_manifest)) {
    failure = MakeFailure(ErrorKind::kPreconditionFailure,
                          "version manifest not found: " + request.version_manifest.string());
    return false;
  }

  logger_.Info("build started",
               {{"working_dir", request.working_dir.string()}, {"command", request.command}});

  core::process::CommandResult result;
  std::string run_error;
  if (!runner_.RunShell(request.command, request.working_dir, result, run_error)) {
    failure = MakeFailure(ErrorKind::kBuildFailure, "unable to launch build: " + run_error);
    return false;
  }
  if (result.exit_code != 0) {
    failure = MakeFailure(ErrorKind::kBuildFailure,
                          "build exited with code " + std::to_string(result.exit_code) + "\n" +
                              core::process::TailLines(result.output, kBuildOutputTailLines));
    return false;
  }

  const std::filesystem::path produced = ResolveAgainst(request.working_dir, request.output_path);
  if (!core::IsExistingRegularFile(produced)) {
    failure = MakeFailure(ErrorKind::kArtifactNotFound,
                          "build succeeded but artifact is missing: " + produced.string());
    return false;
  }

  std::filesystem::path published = produced;
  if (!request.publish_path.empty() && !SamePath(produced, request.publish_path)) {
    std::string error;
    if (!core::EnsureParentDirectory(request.publish_path, error)) {
      failure = MakeFailure(ErrorKind::kIoFailure, error);
      return false;
    }
    std::error_code ec;
    std::filesystem::copy_file(produced, request.publish_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      failure = MakeFailure(ErrorKind::kIoFailure, "unable to copy artifact to '" +
                                                       request.publish_path.string() +
                                                       "': " + ec.message());
      return false;
    }
    published = request.publish_path;
  }

  BuildArtifact measured;
  std::string measure_error;
  if (!MeasureArtifact(published, measured, measure_error)) {
    failure = MakeFailure(ErrorKind::kIoFailure, measure_error);
    return false;
  }
  if (!ReadDeclaredVersion(request, measured.declared_version, failure)) {
    return false;
  }

  artifact = std::move(measured);
  logger_.Info("artifact ready", {{"path", artifact.path.string()},
                                  {"size_bytes", std::to_string(artifact.size_bytes)},
                                  {"sha256", artifact.sha256},
                                  {"version", artifact.declared_version}});
  return true;
}

bool ArtifactBuilder::ReadDeclaredVersion(const BuildRequest& request, std::string& version,
                                          core::errors::Failure& failure) {
  version.clear();
  if (request.version_manifest.empty()) {
    return true;
  }

  manifest::ManifestDocument document;
  std::string error;
  if (!manifest::LoadManifest(request.version_manifest, document, error) ||
      !manifest::ReadField(document, request.version_field, version, error)) {
    failure = MakeFailure(ErrorKind::kPreconditionFailure,
                          "unable to read artifact version from '" +
                              request.version_manifest.string() + "': " + error);
    return false;
  }
  return true;
}

} // namespace relsync::artifacts
