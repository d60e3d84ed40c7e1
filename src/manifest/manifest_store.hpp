#pragma once

#include "core/logging/logger.hpp"
#include "manifest/manifest_document.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace relsync::manifest {

// Reads the manifest as raw bytes. A leading UTF-8 BOM is stripped and
// recorded. JSON manifests must parse; TOML-style manifests are not validated
// beyond what field location needs.
bool LoadManifest(const std::filesystem::path& path, ManifestDocument& document,
                  std::string& error);

// Replaces the value token of an existing field in place. Every byte outside
// the token is kept. Calling it again with the same value returns kUnchanged
// and leaves `document` byte-identical.
//
// kFieldNotFound leaves the document untouched; `detail` says whether the
// field is absent or present but not editable.
UpdateOutcome UpdateField(ManifestDocument& document, std::string_view field_path,
                          const FieldValue& value, std::string& detail);

// Returns false when the field is absent or not a scalar.
bool ReadField(const ManifestDocument& document, std::string_view field_path, std::string& value,
               std::string& error);

// Adds a field that does not exist yet. This is the only operation that
// changes document structure.
bool InsertField(ManifestDocument& document, std::string_view field_path, const FieldValue& value,
                 std::string& error);

// Writes the full document as UTF-8 without BOM, replacing the file.
bool SaveManifest(const ManifestDocument& document, std::string& error);

// Loaded manifest plus the logger its degradations are reported to.
class ManifestStore {
public:
  ManifestStore(std::filesystem::path path, core::logging::Logger& logger)
      : path_(std::move(path)), logger_(logger) {}

  bool Load(std::string& error);

  bool ReadField(std::string_view field_path, std::string& value, std::string& error) const;

  // kFieldNotFound is logged as a warning and the document is left as is.
  UpdateOutcome UpdateField(std::string_view field_path, const FieldValue& value);

  bool InsertField(std::string_view field_path, const FieldValue& value, std::string& error);

  bool Save(std::string& error);

  const ManifestDocument& document() const {
    return document_;
  }

  bool dirty() const {
    return dirty_;
  }

private:
  std::filesystem::path path_;
  core::logging::Logger& logger_;
  ManifestDocument document_;
  bool dirty_ = false;
};

} // namespace relsync::manifest
