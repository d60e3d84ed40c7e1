#pragma once

#include "manifest/manifest_document.hpp"

#include <string>
#include <string_view>

namespace relsync::manifest {

// Finds the value span of `field_path` ("versions.minecraft") in a TOML-style
// document. A path matches any split between `[section]` header and dotted
// key, so `a.b.c` is found as `[a.b] c = ...`, `[a] b.c = ...` or a top-level
// `a.b.c = ...`.
//
// Returns false when the field is absent. `error` is set only when the field
// exists but its value cannot be edited in place (multi-line strings, inline
// tables, arrays).
bool LocateTomlField(std::string_view text, std::string_view field_path, FieldSpan& span,
                     std::string& error);

// JSON variant. The document is parsed for validation and location only.
// Returns false when the document is invalid (error set), the field is absent
// (error empty) or the field is an object/array (error set).
bool LocateJsonField(std::string_view text, std::string_view field_path, FieldSpan& span,
                     std::string& error);

bool LocateField(const ManifestDocument& document, std::string_view field_path, FieldSpan& span,
                 std::string& error);

// Renders `value` as a token for `format`. `existing_quote` keeps the quote
// style of the value being replaced where the new value allows it.
std::string RenderFieldValue(ManifestFormat format, const FieldValue& value, char existing_quote);

// Double-quoted string token, valid both as a TOML basic string and as a JSON
// string.
std::string QuoteBasicString(std::string_view value);

// Unquoted text of the token at `span`.
std::string DecodeFieldValue(std::string_view text, const FieldSpan& span);

// Structural insertion of a field that does not exist yet. Fails when the
// field already exists.
bool InsertTomlField(std::string& text, std::string_view field_path, std::string_view rendered,
                     std::string& error);
bool InsertJsonField(std::string& text, std::string_view field_path, std::string_view rendered,
                     std::string& error);

} // namespace relsync::manifest
