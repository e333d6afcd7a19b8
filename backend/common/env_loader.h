#ifndef CONVERTHUB_CLIENT_ENV_LOADER_H
#define CONVERTHUB_CLIENT_ENV_LOADER_H

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace converthub::env {
namespace detail {

inline std::string Trim(std::string_view value) {
  std::size_t start = 0;
  std::size_t end = value.size();
  while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return std::string(value.substr(start, end - start));
}

inline std::string StripInlineComment(const std::string &value) {
  bool in_single = false;
  bool in_double = false;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '\'' && !in_double) {
      in_single = !in_single;
      continue;
    }
    if (ch == '"' && !in_single) {
      in_double = !in_double;
      continue;
    }
    if (ch == '#' && !in_single && !in_double) {
      return Trim(value.substr(0, i));
    }
  }
  return Trim(value);
}

inline std::string Unquote(std::string value) {
  if (value.size() >= 2) {
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

}  // namespace detail

using EnvEntry = std::pair<std::string, std::string>;

// Parses one `KEY=value` line of an env file. Blank lines, comments, and lines without a
// key yield nothing; a leading `export ` is accepted.
inline std::optional<EnvEntry> ParseEnvLine(std::string_view line) {
  const auto trimmed = detail::Trim(line);
  if (trimmed.empty() || trimmed.front() == '#') {
    return std::nullopt;
  }
  const std::size_t equals = trimmed.find('=');
  if (equals == std::string::npos) {
    return std::nullopt;
  }
  std::string key = detail::Trim(trimmed.substr(0, equals));
  if (key.rfind("export ", 0) == 0) {
    key = detail::Trim(key.substr(7));
  }
  if (key.empty()) {
    return std::nullopt;
  }
  return EnvEntry{std::move(key), detail::Unquote(detail::StripInlineComment(trimmed.substr(equals + 1)))};
}

// Reads every entry of an env file in order; nullopt when the file cannot be opened.
inline std::optional<std::vector<EnvEntry>> ReadEnvFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream.is_open()) {
    return std::nullopt;
  }
  std::vector<EnvEntry> entries;
  std::string line;
  while (std::getline(stream, line)) {
    if (auto entry = ParseEnvLine(line)) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}

namespace detail {

inline void ApplyFile(const std::filesystem::path &path, bool override_existing) {
  const auto entries = ReadEnvFile(path);
  if (!entries) {
    return;
  }
  for (const auto &[key, value] : *entries) {
    if (!override_existing && std::getenv(key.c_str()) != nullptr) {
      continue;
    }
    setenv(key.c_str(), value.c_str(), 1);
  }
}

inline std::optional<std::filesystem::path> FindBaseEnv(const std::filesystem::path &start) {
  namespace fs = std::filesystem;
  fs::path dir = start;
  for (int depth = 0; depth < 8; ++depth) {
    const fs::path candidate = dir / ".env";
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
    const fs::path parent = dir.parent_path();
    if (parent.empty() || parent == dir) {
      break;
    }
    dir = parent;
  }
  return std::nullopt;
}

inline std::filesystem::path ResolvePath(const std::filesystem::path &input,
                                         const std::filesystem::path &base) {
  if (input.is_absolute()) {
    return input;
  }
  return base / input;
}

}  // namespace detail

// Loads CONVERTHUB_ENV_FILE if set, otherwise the nearest .env (and .env.local on top of it).
// Variables already present in the process environment win over .env but not over .env.local.
inline void LoadEnvironment(std::filesystem::path start = std::filesystem::current_path()) {
  static std::once_flag once;
  std::call_once(once, [start = std::move(start)]() {
    namespace fs = std::filesystem;
    if (const char *explicit_env = std::getenv("CONVERTHUB_ENV_FILE"); explicit_env && *explicit_env) {
      const fs::path path = detail::ResolvePath(explicit_env, start);
      detail::ApplyFile(path, true);
      return;
    }
    const auto base_env = detail::FindBaseEnv(start);
    if (!base_env) {
      return;
    }
    detail::ApplyFile(*base_env, false);
    fs::path local = *base_env;
    local += ".local";
    detail::ApplyFile(local, true);
  });
}

inline std::string GetOrDefault(const std::string &key, const std::string &fallback) {
  if (const char *value = std::getenv(key.c_str()); value && *value) {
    return value;
  }
  return fallback;
}

inline std::optional<std::string> Get(const std::string &key) {
  if (const char *value = std::getenv(key.c_str()); value && *value) {
    return std::string(value);
  }
  return std::nullopt;
}

inline std::int64_t ParseInt(const std::string &value, std::int64_t fallback) {
  if (value.empty()) {
    return fallback;
  }
  try {
    std::size_t consumed = 0;
    const auto parsed = std::stoll(value, &consumed);
    return consumed == value.size() ? parsed : fallback;
  } catch (const std::exception &) {
    return fallback;
  }
}

inline std::int64_t GetIntOrDefault(const std::string &key, std::int64_t fallback) {
  return ParseInt(GetOrDefault(key, ""), fallback);
}

}  // namespace converthub::env

#endif  // CONVERTHUB_CLIENT_ENV_LOADER_H
