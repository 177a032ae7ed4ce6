#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "jwtgate/auth/auth_types.h"

namespace jwtgate {
namespace config {

using ConfigurationError = auth::ConfigurationError;

/**
 * @brief Interface for configuration sources
 *
 * Sources are merged by priority; a key set by a higher priority source
 * replaces the same key from lower ones.
 */
class ConfigSource {
 public:
  enum Priority {
    DEFAULT = 0,        // Built-in defaults
    FILE = 100,         // Configuration files
    ENVIRONMENT = 200,  // Environment variables
    OVERRIDE = 300      // Command line / tests
  };

  virtual ~ConfigSource() = default;

  virtual std::string getName() const = 0;

  virtual int getPriority() const = 0;

  virtual bool hasConfiguration() const = 0;

  /**
   * @brief Load configuration from this source
   * @return JSON object with the keys this source sets
   * @throws ConfigurationError if the source exists but is invalid
   */
  virtual nlohmann::json loadConfiguration() = 0;
};

/**
 * @brief Reads PORT, WORKERS, LOG_LEVEL, LOG_FORMAT, JWKS_PATH, JWKS_URL,
 * INSECURE_SKIP_VERIFY and JWKS_REFRESH_INTERVAL
 *
 * Unset and empty variables are treated the same.
 */
class EnvironmentConfigSource : public ConfigSource {
 public:
  EnvironmentConfigSource();

  std::string getName() const override { return "environment"; }
  int getPriority() const override { return ENVIRONMENT; }
  bool hasConfiguration() const override;
  nlohmann::json loadConfiguration() override;

 private:
  static std::string getEnv(const std::string& name);

  std::vector<std::string> variables_;
};

/**
 * @brief YAML (or JSON, which YAML accepts) configuration file
 */
class FileConfigSource : public ConfigSource {
 public:
  explicit FileConfigSource(const std::string& path) : path_(path) {}

  std::string getName() const override { return "file:" + path_; }
  int getPriority() const override { return FILE; }
  bool hasConfiguration() const override;
  nlohmann::json loadConfiguration() override;

 private:
  std::string path_;
};

/**
 * @brief Fixed key/value overrides, used by the command line and tests
 */
class StaticConfigSource : public ConfigSource {
 public:
  StaticConfigSource(std::string name, nlohmann::json values,
                     int priority = OVERRIDE)
      : name_(std::move(name)),
        values_(std::move(values)),
        priority_(priority) {}

  std::string getName() const override { return name_; }
  int getPriority() const override { return priority_; }
  bool hasConfiguration() const override { return !values_.empty(); }
  nlohmann::json loadConfiguration() override { return values_; }

 private:
  std::string name_;
  nlohmann::json values_;
  int priority_;
};

/**
 * @brief Typed service settings after merging every source
 */
struct ServiceConfig {
  // Upper bound for every duration setting
  static constexpr std::chrono::seconds kMaxDuration{365 * 24 * 3600};

  uint16_t port{8080};
  uint32_t workers{0};  // 0: one per hardware thread
  std::string log_level{"info"};
  std::string log_format{"text"};

  std::string jwks_path;  // PEM EC public key, wins over jwks_url
  std::string jwks_url;
  bool insecure_skip_verify{false};
  std::chrono::seconds jwks_refresh_interval{3600};
  std::chrono::seconds jwks_request_timeout{10};
  bool refresh_unknown_kid{false};
  std::chrono::seconds refresh_rate_limit{300};
  std::chrono::seconds clock_skew{0};

  std::string regex_match_mode{"search"};  // search | full
  std::string empty_policy{"allow"};       // allow | deny

  // Output header -> claim name
  std::map<std::string, std::string> response_headers;

  /**
   * @brief Check cross-field constraints
   * @throws ConfigurationError naming the first bad field
   */
  void validate() const;

  uint32_t effectiveWorkers() const;
};

/**
 * @brief Parse "30", "30s", "5m", "1h" or "250ms" (rounded up to seconds)
 * @return false on malformed or negative input
 */
bool parseDuration(const std::string& text, std::chrono::seconds& out);

// Converts a YAML document tree to JSON, typing plain scalars
nlohmann::json yamlToJson(const std::string& document);

/**
 * @brief Build a ServiceConfig from a merged JSON object
 *
 * Unknown keys are ignored with a warning.
 * @throws ConfigurationError on type errors
 */
ServiceConfig configFromJson(const nlohmann::json& json);

/**
 * @brief Merge sources by ascending priority into one JSON object
 */
nlohmann::json mergeSources(
    const std::vector<std::unique_ptr<ConfigSource>>& sources);

/**
 * @brief Load file (if any), then environment, then validate
 *
 * @param config_path explicit file path; when empty JWTGATE_CONFIG is used
 * @throws ConfigurationError on any invalid or missing setting
 */
ServiceConfig loadServiceConfig(const std::string& config_path = "");

}  // namespace config
}  // namespace jwtgate
