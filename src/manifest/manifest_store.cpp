#include "manifest/manifest_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "manifest/field_locator.hpp"

namespace relsync::manifest {

namespace {

constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

} // namespace

bool LoadManifest(const std::filesystem::path& path, ManifestDocument& document,
                  std::string& error) {
  if (!core::IsExistingRegularFile(path)) {
    error = "manifest not found: " + path.string();
    return false;
  }

  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }

  document = ManifestDocument{};
  document.path = path;
  document.format = DetectManifestFormat(path);
  if (text.compare(0, kByteOrderMark.size(), kByteOrderMark) == 0) {
    document.had_byte_order_mark = true;
    text.erase(0, kByteOrderMark.size());
  }
  document.text = std::move(text);

  if (document.format == ManifestFormat::kJson) {
    core::json::Value root;
    std::string parse_error;
    if (!core::json::Parse(document.text, root, parse_error)) {
      error = "manifest '" + path.string() + "' is not valid JSON: " + parse_error;
      return false;
    }
    if (root.type != core::json::Value::Type::kObject) {
      error = "manifest '" + path.string() + "' must contain a JSON object";
      return false;
    }
  }
  return true;
}

UpdateOutcome UpdateField(ManifestDocument& document, std::string_view field_path,
                          const FieldValue& value, std::string& detail) {
  detail.clear();
  FieldSpan span;
  if (!LocateField(document, field_path, span, detail)) {
    if (detail.empty()) {
      detail = "field not found: " + std::string(field_path);
    }
    return UpdateOutcome::kFieldNotFound;
  }

  const std::string rendered = RenderFieldValue(document.format, value, span.quote);
  if (document.text.compare(span.begin, span.end - span.begin, rendered) == 0) {
    return UpdateOutcome::kUnchanged;
  }
  document.text.replace(span.begin, span.end - span.begin, rendered);
  return UpdateOutcome::kUpdated;
}

bool ReadField(const ManifestDocument& document, std::string_view field_path, std::string& value,
               std::string& error) {
  error.clear();
  FieldSpan span;
  if (!LocateField(document, field_path, span, error)) {
    if (error.empty()) {
      error = "field not found: " + std::string(field_path);
    }
    return false;
  }
  value = DecodeFieldValue(document.text, span);
  return true;
}

bool InsertField(ManifestDocument& document, std::string_view field_path, const FieldValue& value,
                 std::string& error) {
  const std::string rendered = RenderFieldValue(document.format, value, '"');
  if (document.format == ManifestFormat::kJson) {
    return InsertJsonField(document.text, field_path, rendered, error);
  }
  return InsertTomlField(document.text, field_path, rendered, error);
}

bool SaveManifest(const ManifestDocument& document, std::string& error) {
  std::string_view text = document.text;
  if (text.substr(0, kByteOrderMark.size()) == kByteOrderMark) {
    text.remove_prefix(kByteOrderMark.size());
  }
  return core::WriteTextFileAtomic(document.path, text, error);
}

bool ManifestStore::Load(std::string& error) {
  if (!LoadManifest(path_, document_, error)) {
    return false;
  }
  dirty_ = false;
  logger_.Debug("manifest loaded", {{"path", path_.string()},
                                    {"format", ToString(document_.format)},
                                    {"bom", document_.had_byte_order_mark ? "true" : "false"}});
  return true;
}

bool ManifestStore::ReadField(std::string_view field_path, std::string& value,
                              std::string& error) const {
  return manifest::ReadField(document_, field_path, value, error);
}

UpdateOutcome ManifestStore::UpdateField(std::string_view field_path, const FieldValue& value) {
  std::string detail;
  const UpdateOutcome outcome = manifest::UpdateField(document_, field_path, value, detail);
  switch (outcome) {
  case UpdateOutcome::kUpdated:
    dirty_ = true;
    logger_.Info("manifest field updated", {{"field", field_path}, {"value", value.text}});
    break;
  case UpdateOutcome::kUnchanged:
    logger_.Debug("manifest field already up to date", {{"field", field_path}});
    break;
  case UpdateOutcome::kFieldNotFound:
    logger_.Warn("manifest field update skipped",
                 {{"field", field_path}, {"error_code", "FIELD_NOT_FOUND"}, {"reason", detail}});
    break;
  }
  return outcome;
}

bool ManifestStore::InsertField(std::string_view field_path, const FieldValue& value,
                                std::string& error) {
  if (!manifest::InsertField(document_, field_path, value, error)) {
    return false;
  }
  dirty_ = true;
  logger_.Info("manifest field inserted", {{"field", field_path}, {"value", value.text}});
  return true;
}

bool ManifestStore::Save(std::string& error) {
  if (!SaveManifest(document_, error)) {
    return false;
  }
  dirty_ = false;
  logger_.Info("manifest saved", {{"path", path_.string()}});
  return true;
}

} // namespace relsync::manifest
