#include "manifest/field_locator.hpp"

#include "core/json_dom.hpp"

namespace relsync::manifest {

namespace {

using JsonValue = core::json::Value;

bool IsContainer(const JsonValue& value) {
  return value.type == JsonValue::Type::kObject || value.type == JsonValue::Type::kArray;
}

const JsonValue* LastMemberInDocumentOrder(const JsonValue& object) {
  const JsonValue* last = nullptr;
  for (const auto& [key, member] : object.object_value) {
    if (last == nullptr || member.source_end > last->source_end) {
      last = &member;
    }
  }
  return last;
}

std::string LeadingIndent(std::string_view text, const std::size_t pos) {
  const std::size_t newline = text.rfind('\n', pos);
  std::size_t i = newline == std::string_view::npos ? 0U : newline + 1U;
  std::string indent;
  while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) {
    indent.push_back(text[i]);
    ++i;
  }
  return indent;
}

} // namespace

bool LocateJsonField(std::string_view text, std::string_view field_path, FieldSpan& span,
                     std::string& error) {
  error.clear();
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "manifest is not valid JSON: " + error;
    return false;
  }

  const JsonValue* field = core::json::FindPath(root, field_path);
  if (field == nullptr) {
    return false;
  }
  if (IsContainer(*field)) {
    error = "field '" + std::string(field_path) + "' is an object or array, not a scalar";
    return false;
  }

  span.begin = field->source_begin;
  span.end = field->source_end;
  span.quote = field->type == JsonValue::Type::kString ? '"' : '\0';
  return true;
}

bool InsertJsonField(std::string& text, std::string_view field_path, std::string_view rendered,
                     std::string& error) {
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "manifest is not valid JSON: " + error;
    return false;
  }
  if (core::json::FindPath(root, field_path) != nullptr) {
    error = "field already exists: " + std::string(field_path);
    return false;
  }

  const std::size_t last_dot = field_path.rfind('.');
  const std::string_view parent_path =
      last_dot == std::string_view::npos ? std::string_view{} : field_path.substr(0, last_dot);
  const std::string_view key =
      last_dot == std::string_view::npos ? field_path : field_path.substr(last_dot + 1U);
  if (key.empty()) {
    error = "invalid field path: " + std::string(field_path);
    return false;
  }

  const JsonValue* parent = parent_path.empty() ? &root : core::json::FindPath(root, parent_path);
  if (parent == nullptr || parent->type != JsonValue::Type::kObject) {
    error = "parent object not found for field: " + std::string(field_path);
    return false;
  }

  const JsonValue* last = LastMemberInDocumentOrder(*parent);
  if (last == nullptr) {
    text.insert(parent->source_begin + 1U, QuoteBasicString(key) + ": " + std::string(rendered));
    return true;
  }

  const bool spaced_colon = last->source_begin > 0U && text[last->source_begin - 1U] == ' ';
  const std::string member = QuoteBasicString(key) + (spaced_colon ? ": " : ":") +
                             std::string(rendered);

  const std::string_view members(text.data() + parent->source_begin,
                                 last->source_begin - parent->source_begin);
  if (members.find('\n') == std::string_view::npos) {
    text.insert(last->source_end, (spaced_colon ? ", " : ",") + member);
    return true;
  }

  const std::string newline = text.find("\r\n") != std::string::npos ? "\r\n" : "\n";
  text.insert(last->source_end, "," + newline + LeadingIndent(text, last->source_begin) + member);
  return true;
}

} // namespace relsync::manifest
