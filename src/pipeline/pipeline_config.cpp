#include "pipeline/pipeline_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <limits>
#include <system_error>

namespace relsync::pipeline {

namespace {

namespace fs = std::filesystem;
using JsonValue = core::json::Value;

std::string QualifiedKey(std::string_view section, std::string_view key) {
  return section.empty() ? std::string(key) : std::string(section) + "." + std::string(key);
}

// Missing keys leave `value` untouched and succeed unless `required`.
bool ParseStringField(const JsonValue& object, std::string_view section, std::string_view key,
                      bool required, std::string& value, std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    if (required) {
      error = "config missing required field '" + QualifiedKey(section, key) + "'";
      return false;
    }
    return true;
  }
  if (field->type != JsonValue::Type::kString) {
    error = "config field '" + QualifiedKey(section, key) + "' must be a string";
    return false;
  }
  if (required && field->string_value.empty()) {
    error = "config field '" + QualifiedKey(section, key) + "' cannot be empty";
    return false;
  }
  value = field->string_value;
  return true;
}

bool ParseUnsignedField(const JsonValue& object, std::string_view section, std::string_view key,
                        std::uint64_t& value, std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return true;
  }
  const double number = field->number_value;
  if (field->type != JsonValue::Type::kNumber || !std::isfinite(number) || number < 0.0 ||
      std::floor(number) != number ||
      number > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    error = "config field '" + QualifiedKey(section, key) + "' must be a non-negative integer";
    return false;
  }
  value = static_cast<std::uint64_t>(number);
  return true;
}

bool ParsePathField(const JsonValue& object, std::string_view section, std::string_view key,
                    bool required, const fs::path& base_dir, fs::path& value,
                    std::string& error) {
  std::string raw;
  if (!ParseStringField(object, section, key, required, raw, error)) {
    return false;
  }
  if (!raw.empty()) {
    const fs::path path(raw);
    value = (path.is_absolute() ? path : base_dir / path).lexically_normal();
  }
  return true;
}

// Optional nested object. Present but not an object is an error.
bool FindSection(const JsonValue& root, std::string_view key, const JsonValue*& section,
                 std::string& error) {
  section = core::json::FindMember(root, key);
  if (section != nullptr && section->type != JsonValue::Type::kObject) {
    error = "config field '" + std::string(key) + "' must be an object";
    return false;
  }
  return true;
}

bool ParseFields(const JsonValue& root, ManifestFieldPaths& fields, std::string& error) {
  const JsonValue* section = nullptr;
  if (!FindSection(root, "fields", section, error)) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }
  return ParseStringField(*section, "fields", "primary_version", false, fields.primary_version,
                          error) &&
         ParseStringField(*section, "fields", "secondary_version", false,
                          fields.secondary_version, error) &&
         ParseStringField(*section, "fields", "artifact_size", false, fields.artifact_size,
                          error) &&
         ParseStringField(*section, "fields", "artifact_hash", false, fields.artifact_hash,
                          error) &&
         ParseStringField(*section, "fields", "artifact_version", false, fields.artifact_version,
                          error);
}

bool ParseVersionLookup(const JsonValue& root, VersionLookupConfig& lookup, std::string& error) {
  const JsonValue* section = nullptr;
  if (!FindSection(root, "version_lookup", section, error)) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }

  std::uint64_t timeout_ms = static_cast<std::uint64_t>(lookup.timeout.count());
  std::uint64_t max_attempts = lookup.max_attempts;
  std::uint64_t retry_base_delay_ms = static_cast<std::uint64_t>(lookup.retry_base_delay.count());
  if (!ParseStringField(*section, "version_lookup", "url", false, lookup.url, error) ||
      !ParseUnsignedField(*section, "version_lookup", "timeout_ms", timeout_ms, error) ||
      !ParseUnsignedField(*section, "version_lookup", "max_attempts", max_attempts, error) ||
      !ParseUnsignedField(*section, "version_lookup", "retry_base_delay_ms", retry_base_delay_ms,
                          error)) {
    return false;
  }
  if (timeout_ms == 0U) {
    error = "config field 'version_lookup.timeout_ms' must be greater than zero";
    return false;
  }
  if (max_attempts == 0U) {
    error = "config field 'version_lookup.max_attempts' must be at least 1";
    return false;
  }

  lookup.timeout = std::chrono::milliseconds(static_cast<std::int64_t>(timeout_ms));
  lookup.max_attempts = static_cast<std::uint32_t>(max_attempts);
  lookup.retry_base_delay =
      std::chrono::milliseconds(static_cast<std::int64_t>(retry_base_delay_ms));
  return true;
}

bool ParseBuild(const JsonValue& root, const fs::path& base_dir, BuildConfig& build,
                std::string& error) {
  const JsonValue* section = nullptr;
  if (!FindSection(root, "build", section, error)) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }

  build.configured = true;
  std::string output_path;
  if (!ParsePathField(*section, "build", "working_dir", true, base_dir, build.working_dir,
                      error) ||
      !ParseStringField(*section, "build", "command", true, build.command, error) ||
      !ParseStringField(*section, "build", "output_path", true, output_path, error) ||
      !ParsePathField(*section, "build", "publish_path", false, base_dir, build.publish_path,
                      error) ||
      !ParsePathField(*section, "build", "version_manifest", false, base_dir,
                      build.version_manifest, error) ||
      !ParseStringField(*section, "build", "version_field", !build.version_manifest.empty(),
                        build.version_field, error)) {
    return false;
  }
  // Relative to the build working directory, resolved by ArtifactBuilder.
  build.output_path = fs::path(output_path);
  return true;
}

bool ParseIndex(const JsonValue& root, const fs::path& base_dir, IndexConfig& index,
                std::string& error) {
  const JsonValue* section = nullptr;
  if (!FindSection(root, "index", section, error)) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }
  return ParsePathField(*section, "index", "source_dir", false, base_dir, index.source_dir,
                        error) &&
         ParseStringField(*section, "index", "refresh_command", false, index.refresh_command,
                          error);
}

bool ParsePublish(const JsonValue& root, const fs::path& base_dir, PublishConfig& publish_config,
                  std::string& error) {
  const JsonValue* section = nullptr;
  if (!FindSection(root, "publish", section, error)) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }

  std::string mode;
  if (!ParseStringField(*section, "publish", "mode", false, mode, error) ||
      !ParsePathField(*section, "publish", "distribution_root", false, base_dir,
                      publish_config.distribution_root, error) ||
      !ParseStringField(*section, "publish", "remote", false, publish_config.remote, error) ||
      !ParseStringField(*section, "publish", "primary_branch", false,
                        publish_config.primary_branch, error)) {
    return false;
  }
  if (!mode.empty() && !publish::ParsePublishMode(mode, publish_config.mode, error)) {
    error = "config field 'publish.mode': " + error;
    return false;
  }
  if (publish_config.remote.empty() || publish_config.primary_branch.empty()) {
    error = "config fields 'publish.remote' and 'publish.primary_branch' cannot be empty";
    return false;
  }
  return true;
}

} // namespace

bool ParsePipelineConfig(std::string_view text, const fs::path& base_dir, PipelineConfig& config,
                         std::string& error) {
  const fs::path config_path = config.config_path;
  config = PipelineConfig{};
  config.config_path = config_path;

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid config JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }

  config.repo_root = base_dir;
  if (!ParsePathField(root, "", "repo_root", false, base_dir, config.repo_root, error) ||
      !ParsePathField(root, "", "manifest_path", true, base_dir, config.manifest_path, error) ||
      !ParseFields(root, config.fields, error) ||
      !ParseVersionLookup(root, config.version_lookup, error) ||
      !ParseBuild(root, base_dir, config.build, error) ||
      !ParseIndex(root, base_dir, config.index, error) ||
      !ParsePublish(root, base_dir, config.publish, error)) {
    return false;
  }

  if (config.index.source_dir.empty()) {
    config.index.source_dir = config.manifest_path.parent_path();
  }
  return true;
}

bool LoadPipelineConfig(const fs::path& config_path, PipelineConfig& config, std::string& error) {
  if (!core::IsExistingRegularFile(config_path)) {
    error = "config file not found: " + config_path.string();
    return false;
  }

  std::string text;
  if (!core::ReadTextFile(config_path, text, error)) {
    return false;
  }

  std::error_code ec;
  fs::path absolute = fs::absolute(config_path, ec);
  if (ec) {
    absolute = config_path;
  }
  absolute = absolute.lexically_normal();

  config.config_path = absolute;
  if (!ParsePipelineConfig(text, absolute.parent_path(), config, error)) {
    error = "config '" + config_path.string() + "': " + error;
    return false;
  }
  return true;
}

} // namespace relsync::pipeline
