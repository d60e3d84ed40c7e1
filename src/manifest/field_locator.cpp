#include "manifest/field_locator.hpp"

#include "core/json_dom.hpp"

#include <cstdio>

namespace relsync::manifest {

namespace {

bool FitsLiteralString(std::string_view value) {
  for (const char c : value) {
    if (c == '\'' || c == '\n' || c == '\r') {
      return false;
    }
  }
  return true;
}

} // namespace

std::string QuoteBasicString(std::string_view value) {
  std::string out = "\"";
  for (const char c : value) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20U || c == 0x7F) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04X", static_cast<unsigned char>(c));
        out += buffer;
      } else {
        out.push_back(c);
      }
      break;
    }
  }
  out.push_back('"');
  return out;
}

const char* ToString(const ManifestFormat format) {
  switch (format) {
  case ManifestFormat::kToml:
    return "toml";
  case ManifestFormat::kJson:
    return "json";
  }
  return "unknown";
}

ManifestFormat DetectManifestFormat(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  for (char& c : extension) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return extension == ".json" ? ManifestFormat::kJson : ManifestFormat::kToml;
}

const char* ToString(const UpdateOutcome outcome) {
  switch (outcome) {
  case UpdateOutcome::kUpdated:
    return "updated";
  case UpdateOutcome::kUnchanged:
    return "unchanged";
  case UpdateOutcome::kFieldNotFound:
    return "field_not_found";
  }
  return "unknown";
}

bool LocateField(const ManifestDocument& document, std::string_view field_path, FieldSpan& span,
                 std::string& error) {
  if (document.format == ManifestFormat::kJson) {
    return LocateJsonField(document.text, field_path, span, error);
  }
  return LocateTomlField(document.text, field_path, span, error);
}

std::string RenderFieldValue(const ManifestFormat format, const FieldValue& value,
                             const char existing_quote) {
  if (value.kind == FieldValue::Kind::kInteger) {
    return value.text;
  }
  if (format == ManifestFormat::kJson) {
    return QuoteBasicString(value.text);
  }
  if (existing_quote == '\'' && FitsLiteralString(value.text)) {
    return "'" + value.text + "'";
  }
  return QuoteBasicString(value.text);
}

std::string DecodeFieldValue(std::string_view text, const FieldSpan& span) {
  const std::string_view token = text.substr(span.begin, span.end - span.begin);
  if (span.quote == '\'') {
    return token.size() >= 2U ? std::string(token.substr(1, token.size() - 2U)) : std::string{};
  }
  if (span.quote == '"') {
    // TOML basic strings and JSON strings share the escapes used in practice.
    core::json::Value decoded;
    std::string error;
    if (core::json::Parse(token, decoded, error) &&
        decoded.type == core::json::Value::Type::kString) {
      return decoded.string_value;
    }
    return token.size() >= 2U ? std::string(token.substr(1, token.size() - 2U)) : std::string{};
  }
  return std::string(token);
}

} // namespace relsync::manifest
