#ifndef CONVERTHUB_CLIENT_LOGGER_H
#define CONVERTHUB_CLIENT_LOGGER_H

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace converthub::logging {

enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

namespace detail {

inline std::string EscapeJson(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const char ch : value) {
    switch (ch) {
      case '"':
        escaped += "\\\"";
        break;
      case '\\':
        escaped += "\\\\";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buffer[7];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x", ch);
          escaped += buffer;
        } else {
          escaped += ch;
        }
        break;
    }
  }
  return escaped;
}

inline std::string TimestampNow() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto seconds = clock::to_time_t(now);
  std::tm tm;
  gmtime_r(&seconds, &tm);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << ms.count() << 'Z';
  return oss.str();
}

inline std::string SanitizeComponentName(std::string_view component) {
  std::string sanitized;
  sanitized.reserve(component.size());
  for (const char ch : component) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
        ch == '_' || ch == '-') {
      sanitized += ch;
    } else {
      sanitized += '_';
    }
  }
  if (sanitized.empty()) {
    sanitized = "converthub";
  }
  return sanitized;
}

inline std::string_view LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "debug";
    case Level::kInfo:
      return "info";
    case Level::kWarn:
      return "warn";
    case Level::kError:
      return "error";
  }
  return "info";
}

inline Level ParseLevel(std::string_view value, Level fallback) {
  if (value == "debug") {
    return Level::kDebug;
  }
  if (value == "info") {
    return Level::kInfo;
  }
  if (value == "warn" || value == "warning") {
    return Level::kWarn;
  }
  if (value == "error") {
    return Level::kError;
  }
  return fallback;
}

inline Level MinimumLevel() {
  static const Level level = []() {
    if (const char *env = std::getenv("CONVERTHUB_LOG_LEVEL"); env && *env) {
      return ParseLevel(env, Level::kInfo);
    }
    return Level::kInfo;
  }();
  return level;
}

// Empty when file output is disabled (CONVERTHUB_LOG_DIRECTORY set to "").
inline const std::optional<std::filesystem::path> &LogDirectoryPath() {
  static std::once_flag flag;
  static std::optional<std::filesystem::path> directory;
  std::call_once(flag, []() {
    std::filesystem::path resolved = "logs";
    if (const char *env = std::getenv("CONVERTHUB_LOG_DIRECTORY")) {
      if (*env == '\0') {
        return;
      }
      resolved = env;
    }
    if (!resolved.is_absolute()) {
      resolved = std::filesystem::current_path() / resolved;
    }
    std::error_code ec;
    std::filesystem::create_directories(resolved, ec);
    directory = resolved;
  });
  return directory;
}

inline std::string BuildLogEntry(std::string_view timestamp, std::string_view component,
                                 std::string_view category, std::string_view message,
                                 std::string_view context) {
  std::ostringstream oss;
  oss << "{\"timestamp\":\"" << EscapeJson(timestamp) << "\",\"service\":\""
      << EscapeJson(component) << "\",\"category\":\"" << EscapeJson(category)
      << "\",\"message\":\"" << EscapeJson(message) << "\"";
  if (!context.empty()) {
    oss << ",\"context\":\"" << EscapeJson(context) << "\"";
  }
  oss << '}';
  return oss.str();
}

inline void AppendLogEntry(const std::filesystem::path &path, const std::string &entry) {
  std::ofstream stream(path, std::ios::app);
  if (!stream.is_open()) {
    return;
  }
  stream << entry << '\n';
}

inline std::mutex &LogMutex() {
  static std::mutex mutex;
  return mutex;
}

inline void EmitConsole(std::string_view component, std::string_view category,
                        std::string_view message, std::string_view context) {
  std::clog << '[' << component << "] " << category << ' ' << message;
  if (!context.empty()) {
    std::clog << " (" << context << ")";
  }
  std::clog << std::endl;
}

}  // namespace detail

// One logger per component ("transport", "upload", "jobs", "webhook", ...).
class ServiceLogger {
 public:
  static ServiceLogger &Instance(std::string_view component) {
    std::string name = component.empty() ? "converthub" : std::string(component);
    const auto key = detail::SanitizeComponentName(name);
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<ServiceLogger>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    if (auto it = registry.find(key); it != registry.end()) {
      return *it->second;
    }

    auto logger = std::unique_ptr<ServiceLogger>(new ServiceLogger(std::move(name)));
    auto *raw = logger.get();
    registry.emplace(key, std::move(logger));
    return *raw;
  }

  ServiceLogger(const ServiceLogger &) = delete;
  ServiceLogger &operator=(const ServiceLogger &) = delete;

  void Log(Level level, std::string_view message, std::string_view context = {}) {
    if (level < detail::MinimumLevel()) {
      return;
    }
    const auto category = detail::LevelName(level);
    Write(category, message, context, level == Level::kError);
  }

  // Free-form categories ("http", "security") are always written.
  void Log(std::string_view category, std::string_view message, std::string_view context = {}) {
    Write(category, message, context, category == "error");
  }

  void Debug(std::string_view message, std::string_view context = {}) {
    Log(Level::kDebug, message, context);
  }

  void Info(std::string_view message, std::string_view context = {}) {
    Log(Level::kInfo, message, context);
  }

  void Warn(std::string_view message, std::string_view context = {}) {
    Log(Level::kWarn, message, context);
  }

  void Error(std::string_view message, std::string_view context = {}) {
    Log(Level::kError, message, context);
  }

  const std::string &component() const { return component_; }

 private:
  explicit ServiceLogger(std::string component)
      : component_(std::move(component)), component_key_(detail::SanitizeComponentName(component_)) {}

  void Write(std::string_view category, std::string_view message, std::string_view context,
             bool is_error) {
    const auto timestamp = detail::TimestampNow();
    const auto entry = detail::BuildLogEntry(timestamp, component_, category, message, context);
    std::lock_guard<std::mutex> lock(detail::LogMutex());
    if (const auto &directory = detail::LogDirectoryPath()) {
      detail::AppendLogEntry(*directory / (component_key_ + ".log"), entry);
      if (is_error) {
        detail::AppendLogEntry(*directory / "errors.log", entry);
      }
    }
    detail::EmitConsole(component_, category, message, context);
  }

  std::string component_;
  std::string component_key_;
};

}  // namespace converthub::logging

#endif  // CONVERTHUB_CLIENT_LOGGER_H
