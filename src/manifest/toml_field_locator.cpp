#include "manifest/field_locator.hpp"

#include <string>
#include <utility>
#include <vector>

namespace relsync::manifest {

namespace {

constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

struct LineView {
  std::size_t begin = 0;
  // Excludes the line terminator ("\n" or "\r\n").
  std::size_t end = 0;
};

struct TomlLine {
  enum class Kind {
    kBlank,
    kHeader,
    kKeyValue,
    kContinuation,
  };

  Kind kind = Kind::kBlank;
  LineView line;
  // Section in effect after this line. For headers this is the new section.
  std::string section;
  std::string full_key;
  FieldSpan span;
  std::string unsupported_reason;
};

bool IsBlank(const char c) {
  return c == ' ' || c == '\t';
}

std::size_t SkipBlanks(std::string_view text, std::size_t pos, const std::size_t end) {
  while (pos < end && IsBlank(text[pos])) {
    ++pos;
  }
  return pos;
}

std::vector<LineView> SplitLines(std::string_view text) {
  std::vector<LineView> lines;
  std::size_t pos = text.substr(0, kByteOrderMark.size()) == kByteOrderMark ? kByteOrderMark.size()
                                                                            : 0U;
  while (pos < text.size()) {
    const std::size_t newline = text.find('\n', pos);
    const std::size_t next = newline == std::string_view::npos ? text.size() : newline + 1U;
    std::size_t end = newline == std::string_view::npos ? text.size() : newline;
    if (end > pos && text[end - 1U] == '\r') {
      --end;
    }
    lines.push_back(LineView{pos, end});
    pos = next;
  }
  return lines;
}

// Trims blanks around segments and strips quotes, so `a . "b"` becomes `a.b`.
bool NormalizeDottedKey(std::string_view raw, std::string& normalized) {
  normalized.clear();
  bool expect_segment = true;
  bool first = true;
  std::size_t i = 0;
  while (i < raw.size()) {
    i = SkipBlanks(raw, i, raw.size());
    if (i >= raw.size()) {
      break;
    }

    if (!expect_segment) {
      if (raw[i] != '.') {
        return false;
      }
      ++i;
      expect_segment = true;
      continue;
    }

    std::string_view segment;
    if (raw[i] == '"' || raw[i] == '\'') {
      const char quote = raw[i];
      const std::size_t close = raw.find(quote, i + 1U);
      if (close == std::string_view::npos) {
        return false;
      }
      segment = raw.substr(i + 1U, close - i - 1U);
      i = close + 1U;
    } else {
      const std::size_t start = i;
      while (i < raw.size() && !IsBlank(raw[i]) && raw[i] != '.') {
        ++i;
      }
      segment = raw.substr(start, i - start);
      if (segment.empty()) {
        return false;
      }
    }

    if (!first) {
      normalized.push_back('.');
    }
    normalized.append(segment);
    first = false;
    expect_segment = false;
  }
  return !expect_segment && !first;
}

std::size_t FindUnquoted(std::string_view text, const char needle, std::size_t pos,
                         const std::size_t end) {
  while (pos < end) {
    const char c = text[pos];
    if (c == needle) {
      return pos;
    }
    if (c == '"' || c == '\'') {
      const std::size_t close = text.find(c, pos + 1U);
      if (close == std::string_view::npos || close >= end) {
        return std::string_view::npos;
      }
      pos = close + 1U;
      continue;
    }
    ++pos;
  }
  return std::string_view::npos;
}

void ScanValue(std::string_view text, TomlLine& entry, std::size_t v, const std::size_t end,
               std::string_view& open_multiline) {
  if (v >= end || text[v] == '#') {
    entry.unsupported_reason = "value is empty";
    return;
  }

  const std::string_view rest = text.substr(v, end - v);
  if (rest.substr(0, 3) == "\"\"\"" || rest.substr(0, 3) == "'''") {
    const std::string_view delimiter = rest.substr(0, 3);
    if (rest.find(delimiter, 3) == std::string_view::npos) {
      open_multiline = delimiter;
    }
    entry.unsupported_reason = "multi-line string values cannot be updated in place";
    return;
  }

  const char first = text[v];
  if (first == '[' || first == '{') {
    entry.unsupported_reason = "arrays and inline tables cannot be updated in place";
    return;
  }

  if (first == '"') {
    std::size_t j = v + 1U;
    while (j < end) {
      if (text[j] == '\\') {
        j += 2U;
        continue;
      }
      if (text[j] == '"') {
        break;
      }
      ++j;
    }
    if (j >= end) {
      entry.unsupported_reason = "unterminated string value";
      return;
    }
    entry.span = FieldSpan{v, j + 1U, '"'};
    return;
  }

  if (first == '\'') {
    const std::size_t close = text.find('\'', v + 1U);
    if (close == std::string_view::npos || close >= end) {
      entry.unsupported_reason = "unterminated string value";
      return;
    }
    entry.span = FieldSpan{v, close + 1U, '\''};
    return;
  }

  std::size_t j = v;
  while (j < end && !IsBlank(text[j]) && text[j] != '#' && text[j] != ',') {
    ++j;
  }
  entry.span = FieldSpan{v, j, '\0'};
}

std::vector<TomlLine> ScanToml(std::string_view text) {
  std::vector<TomlLine> entries;
  std::string section;
  std::string_view open_multiline;

  for (const LineView& line : SplitLines(text)) {
    TomlLine entry;
    entry.line = line;
    entry.section = section;

    if (!open_multiline.empty()) {
      const std::string_view body = text.substr(line.begin, line.end - line.begin);
      if (body.find(open_multiline) != std::string_view::npos) {
        open_multiline = {};
      }
      entry.kind = TomlLine::Kind::kContinuation;
      entries.push_back(std::move(entry));
      continue;
    }

    const std::size_t p = SkipBlanks(text, line.begin, line.end);
    if (p >= line.end || text[p] == '#') {
      entries.push_back(std::move(entry));
      continue;
    }

    if (text[p] == '[') {
      const bool array_table = p + 1U < line.end && text[p + 1U] == '[';
      const std::size_t name_begin = p + (array_table ? 2U : 1U);
      const std::size_t close = FindUnquoted(text, ']', name_begin, line.end);
      std::string normalized;
      if (close == std::string_view::npos ||
          !NormalizeDottedKey(text.substr(name_begin, close - name_begin), normalized)) {
        // Unreadable header: nothing below it can be addressed.
        normalized = std::string(1, '\0');
      }
      section = normalized;
      entry.kind = TomlLine::Kind::kHeader;
      entry.section = section;
      entries.push_back(std::move(entry));
      continue;
    }

    const std::size_t eq = FindUnquoted(text, '=', p, line.end);
    std::string key;
    if (eq == std::string_view::npos || !NormalizeDottedKey(text.substr(p, eq - p), key)) {
      entry.kind = TomlLine::Kind::kContinuation;
      entries.push_back(std::move(entry));
      continue;
    }

    entry.kind = TomlLine::Kind::kKeyValue;
    entry.full_key = section.empty() ? key : section + "." + key;
    ScanValue(text, entry, SkipBlanks(text, eq + 1U, line.end), line.end, open_multiline);
    entries.push_back(std::move(entry));
  }

  return entries;
}

} // namespace

bool LocateTomlField(std::string_view text, std::string_view field_path, FieldSpan& span,
                     std::string& error) {
  error.clear();
  for (const TomlLine& entry : ScanToml(text)) {
    if (entry.kind != TomlLine::Kind::kKeyValue || entry.full_key != field_path) {
      continue;
    }
    if (!entry.unsupported_reason.empty()) {
      error = "field '" + std::string(field_path) + "': " + entry.unsupported_reason;
      return false;
    }
    span = entry.span;
    return true;
  }
  return false;
}

bool InsertTomlField(std::string& text, std::string_view field_path, std::string_view rendered,
                     std::string& error) {
  FieldSpan existing;
  std::string locate_error;
  if (LocateTomlField(text, field_path, existing, locate_error) || !locate_error.empty()) {
    error = "field already exists: " + std::string(field_path);
    return false;
  }

  const std::size_t last_dot = field_path.rfind('.');
  const std::string section(last_dot == std::string_view::npos ? std::string_view{}
                                                               : field_path.substr(0, last_dot));
  const std::string_view key =
      last_dot == std::string_view::npos ? field_path : field_path.substr(last_dot + 1U);
  if (key.empty() || (last_dot != std::string_view::npos && section.empty())) {
    error = "invalid field path: " + std::string(field_path);
    return false;
  }

  const std::string newline = text.find("\r\n") != std::string::npos ? "\r\n" : "\n";
  const std::string assignment = std::string(key) + " = " + std::string(rendered);

  const std::vector<TomlLine> entries = ScanToml(text);
  bool section_found = section.empty();
  std::size_t insert_after = std::string::npos;
  std::size_t first_header_begin = std::string::npos;
  for (const TomlLine& entry : entries) {
    if (entry.kind == TomlLine::Kind::kHeader) {
      if (first_header_begin == std::string::npos) {
        first_header_begin = entry.line.begin;
      }
      if (entry.section == section && !section_found) {
        section_found = true;
        insert_after = entry.line.end;
      }
      continue;
    }
    if (entry.kind == TomlLine::Kind::kKeyValue && entry.section == section) {
      insert_after = entry.line.end;
    }
  }

  if (insert_after != std::string::npos) {
    text.insert(insert_after, newline + assignment);
    return true;
  }

  if (section.empty()) {
    std::size_t insert_at = first_header_begin;
    if (insert_at == std::string::npos) {
      insert_at = text.size();
      if (!text.empty() && text.back() != '\n') {
        text += newline;
        insert_at = text.size();
      }
    }
    text.insert(insert_at, assignment + newline);
    return true;
  }

  if (!text.empty() && text.back() != '\n') {
    text += newline;
  }
  if (!text.empty()) {
    text += newline;
  }
  text += "[" + section + "]" + newline + assignment + newline;
  return true;
}

} // namespace relsync::manifest
