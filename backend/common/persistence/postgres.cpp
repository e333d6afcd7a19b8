#include "postgres.h"

#include <stdexcept>

#include "../env_loader.h"

namespace converthub::persistence {

namespace {

// Key/value settings are appended; URI connection strings take them as query parameters.
std::string AppendSetting(const std::string &conninfo, const std::string &key, const std::string &value) {
  if (conninfo.find(key + "=") != std::string::npos) {
    return conninfo;
  }
  const bool is_uri = conninfo.rfind("postgres://", 0) == 0 || conninfo.rfind("postgresql://", 0) == 0;
  if (!is_uri) {
    return conninfo + " " + key + "=" + value;
  }
  return conninfo + (conninfo.find('?') == std::string::npos ? "?" : "&") + key + "=" + value;
}

}  // namespace

PostgresConfig::PostgresConfig(std::string conninfo, std::string application_name,
                               std::chrono::seconds connect_timeout) {
  if (conninfo.empty()) {
    throw std::invalid_argument("connection string must not be empty");
  }
  if (connect_timeout.count() <= 0) {
    throw std::invalid_argument("connect timeout must be positive");
  }
  conninfo_ = AppendSetting(conninfo, "connect_timeout", std::to_string(connect_timeout.count()));
  if (!application_name.empty()) {
    conninfo_ = AppendSetting(conninfo_, "application_name", application_name);
  }
}

const std::string &PostgresConfig::ConnInfo() const {
  return conninfo_;
}

pqxx::connection PostgresConfig::Connect() const {
  return pqxx::connection(conninfo_);
}

std::shared_ptr<PostgresConfig> MakePostgresConfigFromEnv(const std::string &env_var,
                                                          const std::string &default_url,
                                                          const std::string &application_name) {
  return std::make_shared<PostgresConfig>(env::GetOrDefault(env_var, default_url), application_name);
}

}  // namespace converthub::persistence
