#pragma once

#include "core/errors/failure.hpp"
#include "core/process/command_runner.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace relsync::core::logging {
class Logger;
}

namespace relsync::artifacts {

struct BuildRequest {
  std::filesystem::path working_dir;
  std::string command;
  // Where the toolchain leaves the binary, relative to `working_dir` unless
  // absolute.
  std::filesystem::path output_path;
  // Publish-facing copy. Empty keeps the artifact where the toolchain put it.
  std::filesystem::path publish_path;
  // Optional source of the artifact's declared semantic version.
  std::filesystem::path version_manifest;
  std::string version_field;
};

struct BuildArtifact {
  std::filesystem::path path;
  std::uint64_t size_bytes = 0;
  std::string sha256;
  std::string declared_version;
};

// Runs the external toolchain and measures what it produced. Size and hash are
// recomputed from the published bytes on every call.
class ArtifactBuilder {
public:
  ArtifactBuilder(core::process::ICommandRunner& runner, core::logging::Logger& logger)
      : runner_(runner), logger_(logger) {}

  // Failure kinds: kPreconditionFailure (missing working dir or version
  // manifest), kBuildFailure (toolchain exit != 0 or launch failure),
  // kArtifactNotFound (exit 0 but no binary), kIoFailure (copy/hash).
  bool Build(const BuildRequest& request, BuildArtifact& artifact,
             core::errors::Failure& failure);

private:
  bool ReadDeclaredVersion(const BuildRequest& request, std::string& version,
                           core::errors::Failure& failure);

  core::process::ICommandRunner& runner_;
  core::logging::Logger& logger_;
};

// Byte length and SHA-256 of an existing file.
bool MeasureArtifact(const std::filesystem::path& path, BuildArtifact& artifact,
                     std::string& error);

} // namespace relsync::artifacts
