#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace devtask::core::logging {

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

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  struct Alias {
    std::string_view name;
    LogLevel level;
  };
  constexpr std::array<Alias, 5> kAliases = {{
      {"debug", LogLevel::kDebug},
      {"info", LogLevel::kInfo},
      {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn},
      {"error", LogLevel::kError},
  }};
  for (const auto& alias : kAliases) {
    if (normalized == alias.name) {
      level = alias.level;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// Line-oriented key=value logger for devtask's own diagnostics.
//
// Tool output goes straight to the inherited terminal, so these lines go to
// stderr by default and stay greppable next to it:
//   ts_utc=2026-01-01T00:00:00.000Z level=INFO task=check msg="step started" program=uv
// Values are quoted only when they contain whitespace, quotes, '=' or are empty.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetTask(std::string task) {
    task_ = std::move(task);
  }

  void ClearTask() {
    task_ = "-";
  }

  const std::string& Task() const {
    return task_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::ostringstream line;
    line << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
         << " level=" << ToString(level) << " task=" << FormatValue(task_)
         << " msg=" << FormatValue(message);
    for (const auto& field : fields) {
      line << ' ' << field.key << '=' << FormatValue(field.value);
    }
    line << '\n';

    // One write per line keeps lines whole when a child shares the stream.
    (*out_) << line.str();
    out_->flush();
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
    const auto millis_since_epoch =
        std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    const auto millis_component =
        static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

    const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
    std::tm utc_time{};
    if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
      return "";
    }

    std::ostringstream out;
    out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis_component << 'Z';
    return out.str();
  }

  static bool NeedsQuoting(std::string_view raw) {
    if (raw.empty()) {
      return true;
    }
    return std::any_of(raw.begin(), raw.end(), [](unsigned char c) {
      return std::isspace(c) != 0 || c == '"' || c == '=' || c == '\\';
    });
  }

  static std::string FormatValue(std::string_view raw) {
    if (!NeedsQuoting(raw)) {
      return std::string(raw);
    }

    std::string quoted = "\"";
    quoted.reserve(raw.size() + 2U);
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

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string task_ = "-";
};

} // namespace devtask::core::logging
