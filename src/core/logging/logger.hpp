#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace refinery::core::logging {

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
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
  } else if (normalized == "info") {
    level = LogLevel::kInfo;
  } else if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
  } else if (normalized == "error") {
    level = LogLevel::kError;
  } else {
    error = "invalid log level '" + normalized + "' (expected debug|info|warn|error)";
    return false;
  }
  return true;
}

// Structured key=value logger shared by every engine component.
//
// One instance is injected by reference into sessions, the harness, the
// optimizer and the distributed processor. Lines are written whole under an
// internal mutex so worker threads can share one sink.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    std::lock_guard<std::mutex> lock(mu_);
    return min_level_;
  }

  // Correlates every line of one optimization run or CLI invocation.
  void SetRunId(std::string run_id) {
    std::lock_guard<std::mutex> lock(mu_);
    run_id_ = std::move(run_id);
  }

  bool ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    // Format outside the lock; only the write is serialized.
    std::string line;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
      }
      line = "ts_utc=" + FormatUtcTimestamp(std::chrono::system_clock::now()) +
             " level=" + ToString(level) + " run_id=" + Quote(run_id_);
    }
    line += " msg=" + Quote(message);
    for (const auto& field : fields) {
      line += ' ';
      line.append(field.key);
      line += '=';
      line += Quote(field.value);
    }
    line += '\n';

    std::lock_guard<std::mutex> lock(mu_);
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
  static std::string Quote(std::string_view raw) {
    std::string quoted;
    quoted.reserve(raw.size() + 2U);
    quoted.push_back('"');
    for (const char c : raw) {
      switch (c) {
      case '\\':
        quoted += "\\\\";
        break;
      case '"':
        quoted += "\\\"";
        break;
      case '\n':
        quoted += "\\n";
        break;
      case '\r':
        quoted += "\\r";
        break;
      case '\t':
        quoted += "\\t";
        break;
      default:
        quoted.push_back(c);
        break;
      }
    }
    quoted.push_back('"');
    return quoted;
  }

  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string run_id_ = "-";
};

} // namespace refinery::core::logging
