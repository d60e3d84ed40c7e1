#pragma once

#include "publish/publish_coordinator.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace relsync::pipeline {

inline constexpr const char* kDefaultConfigFileName = "relsync.json";

// Structural paths of the fields the pipeline owns inside the manifest.
struct ManifestFieldPaths {
  std::string primary_version = "versions.minecraft";
  std::string secondary_version = "versions.fabric";
  std::string artifact_size = "updater.size";
  std::string artifact_hash = "updater.sha256";
  std::string artifact_version = "updater.version";
};

struct VersionLookupConfig {
  // Empty means no remote lookup; resolution always falls back.
  std::string url;
  std::chrono::milliseconds timeout{10000};
  std::uint32_t max_attempts = 3U;
  std::chrono::milliseconds retry_base_delay{1000};
};

struct BuildConfig {
  // False when the config has no "build" object; `--build` is then rejected.
  bool configured = false;
  std::filesystem::path working_dir;
  std::string command;
  std::filesystem::path output_path;
  std::filesystem::path publish_path;
  std::filesystem::path version_manifest;
  std::string version_field;
};

struct IndexConfig {
  std::filesystem::path source_dir;
  std::string refresh_command;
};

struct PublishConfig {
  publish::PublishMode mode = publish::PublishMode::kDirectMirror;
  std::filesystem::path distribution_root;
  std::string remote = "origin";
  std::string primary_branch = "main";
};

// All paths are absolute after loading: relative entries resolve against the
// directory holding the config file.
struct PipelineConfig {
  std::filesystem::path config_path;
  std::filesystem::path repo_root;
  std::filesystem::path manifest_path;
  ManifestFieldPaths fields;
  VersionLookupConfig version_lookup;
  BuildConfig build;
  IndexConfig index;
  PublishConfig publish;
};

bool ParsePipelineConfig(std::string_view text, const std::filesystem::path& base_dir,
                         PipelineConfig& config, std::string& error);

bool LoadPipelineConfig(const std::filesystem::path& config_path, PipelineConfig& config,
                        std::string& error);

} // namespace relsync::pipeline
