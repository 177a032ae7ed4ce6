#define JWTGATE_LOG_COMPONENT "jwtgate.config"

#include "jwtgate/config/service_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <sstream>
#include <thread>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "jwtgate/logging/log_level.h"
#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace config {

namespace {

bool parseInteger(const std::string& text, int64_t& out) {
  if (text.empty()) {
    return false;
  }
  try {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed, 10);
    if (consumed != text.size()) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::logic_error&) {
    // invalid_argument or out_of_range
    return false;
  }
}

using EnvMapper = std::function<void(const std::string&, nlohmann::json&)>;

struct EnvMapping {
  const char* variable;
  EnvMapper apply;
};

const std::vector<EnvMapping>& environmentMappings() {
  static const std::vector<EnvMapping> mappings = {
      {"PORT",
       [](const std::string& val, nlohmann::json& out) {
         int64_t port = 0;
         if (!parseInteger(val, port)) {
           throw ConfigurationError("PORT must be a number, got '" + val +
                                    "'");
         }
         out["port"] = port;
       }},
      {"WORKERS",
       [](const std::string& val, nlohmann::json& out) {
         int64_t workers = 0;
         if (!parseInteger(val, workers)) {
           throw ConfigurationError("WORKERS must be a number, got '" + val +
                                    "'");
         }
         out["workers"] = workers;
       }},
      {"LOG_LEVEL",
       [](const std::string& val, nlohmann::json& out) {
         out["log_level"] = val;
       }},
      {"LOG_FORMAT",
       [](const std::string& val, nlohmann::json& out) {
         out["log_format"] = val;
       }},
      {"JWKS_PATH",
       [](const std::string& val, nlohmann::json& out) {
         out["jwks_path"] = val;
       }},
      {"JWKS_URL",
       [](const std::string& val, nlohmann::json& out) {
         out["jwks_url"] = val;
       }},
      {"INSECURE_SKIP_VERIFY",
       [](const std::string& val, nlohmann::json& out) {
         out["insecure_skip_verify"] = (val == "true");
       }},
      {"JWKS_REFRESH_INTERVAL",
       [](const std::string& val, nlohmann::json& out) {
         out["jwks_refresh_interval"] = val;
       }},
  };
  return mappings;
}

nlohmann::json scalarToJson(const YAML::Node& node) {
  const std::string text = node.Scalar();
  // Quoted scalars carry the non-specific "!" tag and stay strings
  if (node.Tag() == "!") {
    return text;
  }

  bool flag = false;
  if (YAML::convert<bool>::decode(node, flag)) {
    return flag;
  }
  int64_t integer = 0;
  if (parseInteger(text, integer)) {
    return integer;
  }
  if (text.find_first_of(".eE") != std::string::npos) {
    double number = 0;
    if (YAML::convert<double>::decode(node, number)) {
      return number;
    }
  }
  return text;
}

nlohmann::json yamlNodeToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;
    case YAML::NodeType::Scalar:
      return scalarToJson(node);
    case YAML::NodeType::Sequence: {
      auto result = nlohmann::json::array();
      for (const auto& item : node) {
        result.push_back(yamlNodeToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = nlohmann::json::object();
      for (const auto& pair : node) {
        result[pair.first.as<std::string>()] = yamlNodeToJson(pair.second);
      }
      return result;
    }
  }
  return nullptr;
}

std::string readString(const nlohmann::json& json, const char* key) {
  const auto& value = json.at(key);
  if (!value.is_string()) {
    throw ConfigurationError(std::string(key) + " must be a string");
  }
  return value.get<std::string>();
}

bool readBool(const nlohmann::json& json, const char* key) {
  const auto& value = json.at(key);
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_string()) {
    const std::string text = logging::toLowerAscii(value.get<std::string>());
    if (text == "true") {
      return true;
    }
    if (text == "false") {
      return false;
    }
  }
  throw ConfigurationError(std::string(key) + " must be true or false");
}

int64_t readInteger(const nlohmann::json& json, const char* key,
                    int64_t min, int64_t max) {
  const auto& value = json.at(key);
  int64_t result = 0;
  if (value.is_number_integer()) {
    result = value.get<int64_t>();
  } else if (!value.is_string() ||
             !parseInteger(value.get<std::string>(), result)) {
    throw ConfigurationError(std::string(key) + " must be an integer");
  }
  if (result < min || result > max) {
    throw ConfigurationError(std::string(key) + " must be between " +
                             std::to_string(min) + " and " +
                             std::to_string(max));
  }
  return result;
}

std::chrono::seconds readDuration(const nlohmann::json& json,
                                  const char* key) {
  const auto& value = json.at(key);
  std::chrono::seconds result{0};
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    return std::chrono::seconds(value.get<int64_t>());
  }
  if (value.is_string() && parseDuration(value.get<std::string>(), result)) {
    return result;
  }
  throw ConfigurationError(std::string(key) +
                           " must be a non-negative duration like 30s, 5m "
                           "or 1h");
}

const char* const kKnownKeys[] = {
    "port",          "workers",
    "log_level",     "log_format",
    "jwks_path",     "jwks_url",
    "insecure_skip_verify",
    "jwks_refresh_interval",
    "jwks_request_timeout",
    "refresh_unknown_kid",
    "refresh_rate_limit",
    "clock_skew",    "regex_match_mode",
    "empty_policy",  "response_headers"};

bool isKnownKey(const std::string& key) {
  for (const char* known : kKnownKeys) {
    if (key == known) {
      return true;
    }
  }
  return false;
}

}  // namespace

// EnvironmentConfigSource

EnvironmentConfigSource::EnvironmentConfigSource() {
  for (const auto& mapping : environmentMappings()) {
    variables_.push_back(mapping.variable);
  }
}

std::string EnvironmentConfigSource::getEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : std::string();
}

bool EnvironmentConfigSource::hasConfiguration() const {
  return std::any_of(variables_.begin(), variables_.end(),
                     [](const std::string& name) {
                       return !getEnv(name).empty();
                     });
}

nlohmann::json EnvironmentConfigSource::loadConfiguration() {
  auto result = nlohmann::json::object();
  for (const auto& mapping : environmentMappings()) {
    const std::string value = getEnv(mapping.variable);
    if (value.empty()) {
      continue;
    }
    mapping.apply(value, result);
    JWTGATE_LOG(Debug, "environment sets {}", mapping.variable);
  }
  return result;
}

// FileConfigSource

bool FileConfigSource::hasConfiguration() const {
  std::ifstream file(path_);
  return file.good();
}

nlohmann::json FileConfigSource::loadConfiguration() {
  std::ifstream file(path_, std::ios::in | std::ios::binary);
  if (!file) {
    throw ConfigurationError("cannot open configuration file " + path_);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  nlohmann::json result;
  try {
    result = yamlToJson(buffer.str());
  } catch (const YAML::ParserException& e) {
    throw ConfigurationError("YAML parse error in " + path_ + " at line " +
                             std::to_string(e.mark.line + 1) + ", column " +
                             std::to_string(e.mark.column + 1) + ": " +
                             e.msg);
  }

  if (result.is_null()) {
    return nlohmann::json::object();
  }
  if (!result.is_object()) {
    throw ConfigurationError("configuration file " + path_ +
                             " must contain a mapping");
  }
  JWTGATE_LOG(Info, "loaded configuration file {}", path_);
  return result;
}

// ServiceConfig

void ServiceConfig::validate() const {
  if (jwks_path.empty() && jwks_url.empty()) {
    throw ConfigurationError("no JWKS_URL or JWKS_PATH");
  }
  if (!logging::isKnownLogLevel(log_level)) {
    throw ConfigurationError("unknown log_level '" + log_level + "'");
  }
  if (log_format != "text" && log_format != "json") {
    throw ConfigurationError("log_format must be text or json");
  }
  if (regex_match_mode != "search" && regex_match_mode != "full") {
    throw ConfigurationError("regex_match_mode must be search or full");
  }
  if (empty_policy != "allow" && empty_policy != "deny") {
    throw ConfigurationError("empty_policy must be allow or deny");
  }
  if (jwks_path.empty() && jwks_refresh_interval.count() == 0) {
    throw ConfigurationError("jwks_refresh_interval must be positive");
  }
  if (jwks_request_timeout.count() == 0) {
    throw ConfigurationError("jwks_request_timeout must be positive");
  }
  const std::pair<const char*, std::chrono::seconds> durations[] = {
      {"jwks_refresh_interval", jwks_refresh_interval},
      {"jwks_request_timeout", jwks_request_timeout},
      {"refresh_rate_limit", refresh_rate_limit},
      {"clock_skew", clock_skew}};
  for (const auto& duration : durations) {
    if (duration.second > kMaxDuration) {
      throw ConfigurationError(std::string(duration.first) +
                               " must not exceed " +
                               std::to_string(kMaxDuration.count()) + "s");
    }
  }
  for (const auto& entry : response_headers) {
    if (entry.first.empty() || entry.second.empty()) {
      throw ConfigurationError(
          "response_headers entries need a header and a claim name");
    }
  }
}

uint32_t ServiceConfig::effectiveWorkers() const {
  if (workers > 0) {
    return workers;
  }
  unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? hw : 1;
}

bool parseDuration(const std::string& text, std::chrono::seconds& out) {
  size_t digits = 0;
  while (digits < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[digits]))) {
    ++digits;
  }
  if (digits == 0) {
    return false;
  }

  int64_t value = 0;
  if (!parseInteger(text.substr(0, digits), value)) {
    return false;
  }

  const std::string unit = text.substr(digits);
  int64_t multiplier = 0;
  if (unit.empty() || unit == "s") {
    multiplier = 1;
  } else if (unit == "m") {
    multiplier = 60;
  } else if (unit == "h") {
    multiplier = 3600;
  } else if (unit == "ms") {
    out = std::chrono::seconds((value + 999) / 1000);
    return true;
  } else {
    return false;
  }

  if (value > std::numeric_limits<int64_t>::max() / multiplier) {
    return false;
  }
  out = std::chrono::seconds(value * multiplier);
  return true;
}

nlohmann::json yamlToJson(const std::string& document) {
  return yamlNodeToJson(YAML::Load(document));
}

ServiceConfig configFromJson(const nlohmann::json& json) {
  ServiceConfig config;
  if (json.is_null()) {
    return config;
  }
  if (!json.is_object()) {
    throw ConfigurationError("configuration must be an object");
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    if (!isKnownKey(it.key())) {
      JWTGATE_LOG(Warning, "ignoring unknown configuration key '{}'",
                  it.key());
    }
  }

  if (json.contains("port")) {
    config.port = static_cast<uint16_t>(readInteger(json, "port", 0, 65535));
  }
  if (json.contains("workers")) {
    config.workers =
        static_cast<uint32_t>(readInteger(json, "workers", 0, 1024));
  }
  if (json.contains("log_level")) {
    config.log_level = logging::toLowerAscii(readString(json, "log_level"));
  }
  if (json.contains("log_format")) {
    config.log_format = logging::toLowerAscii(readString(json, "log_format"));
  }
  if (json.contains("jwks_path")) {
    config.jwks_path = readString(json, "jwks_path");
  }
  if (json.contains("jwks_url")) {
    config.jwks_url = readString(json, "jwks_url");
  }
  if (json.contains("insecure_skip_verify")) {
    config.insecure_skip_verify = readBool(json, "insecure_skip_verify");
  }
  if (json.contains("jwks_refresh_interval")) {
    config.jwks_refresh_interval =
        readDuration(json, "jwks_refresh_interval");
  }
  if (json.contains("jwks_request_timeout")) {
    config.jwks_request_timeout = readDuration(json, "jwks_request_timeout");
  }
  if (json.contains("refresh_unknown_kid")) {
    config.refresh_unknown_kid = readBool(json, "refresh_unknown_kid");
  }
  if (json.contains("refresh_rate_limit")) {
    config.refresh_rate_limit = readDuration(json, "refresh_rate_limit");
  }
  if (json.contains("clock_skew")) {
    config.clock_skew = readDuration(json, "clock_skew");
  }
  if (json.contains("regex_match_mode")) {
    config.regex_match_mode =
        logging::toLowerAscii(readString(json, "regex_match_mode"));
  }
  if (json.contains("empty_policy")) {
    config.empty_policy =
        logging::toLowerAscii(readString(json, "empty_policy"));
  }
  if (json.contains("response_headers")) {
    const auto& headers = json.at("response_headers");
    if (!headers.is_null()) {
      if (!headers.is_object()) {
        throw ConfigurationError(
            "response_headers must map header names to claim names");
      }
      for (auto it = headers.begin(); it != headers.end(); ++it) {
        if (!it.value().is_string()) {
          throw ConfigurationError("response_headers." + it.key() +
                                   " must be a claim name");
        }
        config.response_headers[it.key()] = it.value().get<std::string>();
      }
    }
  }

  return config;
}

nlohmann::json mergeSources(
    const std::vector<std::unique_ptr<ConfigSource>>& sources) {
  std::vector<ConfigSource*> ordered;
  for (const auto& source : sources) {
    if (source) {
      ordered.push_back(source.get());
    }
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const ConfigSource* a, const ConfigSource* b) {
                     return a->getPriority() < b->getPriority();
                   });

  auto merged = nlohmann::json::object();
  for (ConfigSource* source : ordered) {
    if (!source->hasConfiguration()) {
      continue;
    }
    nlohmann::json values = source->loadConfiguration();
    for (auto it = values.begin(); it != values.end(); ++it) {
      merged[it.key()] = it.value();
    }
    JWTGATE_LOG(Debug, "merged {} keys from {}", values.size(),
                source->getName());
  }
  return merged;
}

ServiceConfig loadServiceConfig(const std::string& config_path) {
  std::string path = config_path;
  if (path.empty()) {
    const char* env_path = std::getenv("JWTGATE_CONFIG");
    if (env_path) {
      path = env_path;
    }
  }

  std::vector<std::unique_ptr<ConfigSource>> sources;
  if (!path.empty()) {
    auto file = std::make_unique<FileConfigSource>(path);
    // An explicitly named file must exist
    if (!file->hasConfiguration()) {
      throw ConfigurationError("cannot open configuration file " + path);
    }
    sources.push_back(std::move(file));
  }
  sources.push_back(std::make_unique<EnvironmentConfigSource>());

  ServiceConfig config = configFromJson(mergeSources(sources));
  config.validate();
  return config;
}

}  // namespace config
}  // namespace jwtgate
