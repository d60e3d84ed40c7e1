#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace relsync::manifest {

enum class ManifestFormat {
  kToml,
  kJson,
};

const char* ToString(ManifestFormat format);

// `.json` selects JSON, everything else is treated as TOML-style key/value text.
ManifestFormat DetectManifestFormat(const std::filesystem::path& path);

// The manifest is kept as an opaque text buffer. Fields are addressed as byte
// spans inside `text`, never through a re-serialized object graph.
struct ManifestDocument {
  std::filesystem::path path;
  ManifestFormat format = ManifestFormat::kToml;
  std::string text;
  // A UTF-8 BOM found on load is stripped from `text` and remembered here.
  // It is never written back.
  bool had_byte_order_mark = false;
};

// Byte range of one scalar value token, quotes included.
struct FieldSpan {
  std::size_t begin = 0;
  std::size_t end = 0;
  // '"' or '\'' for quoted strings, '\0' for bare tokens (numbers, booleans).
  char quote = '\0';
};

struct FieldValue {
  enum class Kind {
    kString,
    kInteger,
  };

  Kind kind = Kind::kString;
  std::string text;

  static FieldValue String(std::string value) {
    FieldValue field;
    field.kind = Kind::kString;
    field.text = std::move(value);
    return field;
  }

  static FieldValue Integer(std::uint64_t value) {
    FieldValue field;
    field.kind = Kind::kInteger;
    field.text = std::to_string(value);
    return field;
  }
};

enum class UpdateOutcome {
  kUpdated,
  kUnchanged,
  kFieldNotFound,
};

const char* ToString(UpdateOutcome outcome);

} // namespace relsync::manifest
