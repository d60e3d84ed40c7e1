#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relsync::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected debug|info|warn|error)";
  return false;
}

// Single-line key=value logger. One instance lives for one pipeline run and
// stamps its run id on every line, followed by any context fields pushed with
// ContextField (the pipeline pushes the current stage).
//
// Warnings are counted even when filtered out by the minimum level.
class Logger {
public:
  // Appends `key=value` to every line logged while the guard is alive.
  class ContextField {
  public:
    ContextField(Logger& logger, std::string key, std::string value) : logger_(logger) {
      logger_.context_.emplace_back(std::move(key), std::move(value));
    }
    ~ContextField() {
      logger_.context_.pop_back();
    }

    ContextField(const ContextField&) = delete;
    ContextField& operator=(const ContextField&) = delete;

  private:
    Logger& logger_;
  };

  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetRunId(std::string run_id) {
    run_id_ = std::move(run_id);
  }

  std::size_t WarningCount() const {
    return warning_count_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (level == LogLevel::kWarn) {
      ++warning_count_;
    }
    if (!ShouldLog(level)) {
      return;
    }

    std::string line = "ts_utc=" + FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    AppendField(line, "run_id", run_id_);
    for (const auto& [key, value] : context_) {
      AppendField(line, key, value);
    }
    AppendField(line, "msg", message);
    for (const auto& field : fields) {
      AppendField(line, field.key, field.value);
    }
    line.push_back('\n');

    (*out_) << line;
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  // ` key="value"` with backslash, quote and control characters escaped.
  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line.push_back(' ');
    line.append(key);
    line += "=\"";
    for (const char c : value) {
      switch (c) {
      case '\\':
        line += "\\\\";
        break;
      case '"':
        line += "\\\"";
        break;
      case '\n':
        line += "\\n";
        break;
      case '\r':
        line += "\\r";
        break;
      case '\t':
        line += "\\t";
        break;
      default:
        line.push_back(c);
        break;
      }
    }
    line.push_back('"');
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string run_id_ = "-";
  std::vector<std::pair<std::string, std::string>> context_;
  std::size_t warning_count_ = 0;
};

} // namespace relsync::core::logging
