#include "config/engine_config.hpp"

#include <fstream>

namespace payments {
namespace config {

namespace {

std::string requireString(const nlohmann::json& j, const std::string& key) {
  const auto& value = j.at(key);
  if (!value.is_string()) {
    throw ConfigError("config key '" + key + "' must be a string");
  }
  return value.get<std::string>();
}

}  // namespace

std::optional<ErrorPolicy> parseErrorPolicy(const std::string& name) {
  if (name == "abort") return ErrorPolicy::ABORT;
  if (name == "skip") return ErrorPolicy::SKIP;
  return std::nullopt;
}

std::string errorPolicyName(ErrorPolicy policy) {
  switch (policy) {
    case ErrorPolicy::ABORT: return "abort";
    case ErrorPolicy::SKIP: return "skip";
    default: return "unknown";
  }
}

std::optional<OutputFormat> parseOutputFormat(const std::string& name) {
  if (name == "csv") return OutputFormat::CSV;
  if (name == "json") return OutputFormat::JSON;
  return std::nullopt;
}

std::string outputFormatName(OutputFormat format) {
  switch (format) {
    case OutputFormat::CSV: return "csv";
    case OutputFormat::JSON: return "json";
    default: return "unknown";
  }
}

void EngineConfig::merge(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("config must be a JSON object");
  }

  for (const auto& item : j.items()) {
    const std::string& key = item.key();
    if (key == "error_policy") {
      const std::string name = requireString(j, key);
      auto policy = parseErrorPolicy(name);
      if (!policy) throw ConfigError("unknown error_policy '" + name + "'");
      error_policy = *policy;
    } else if (key == "log_level") {
      const std::string name = requireString(j, key);
      auto level = observability::parseLogLevel(name);
      if (!level) throw ConfigError("unknown log_level '" + name + "'");
      log_level = *level;
    } else if (key == "output_format") {
      const std::string name = requireString(j, key);
      auto format = parseOutputFormat(name);
      if (!format) throw ConfigError("unknown output_format '" + name + "'");
      output_format = *format;
    } else if (key == "metrics_file") {
      metrics_file = requireString(j, key);
    } else {
      throw ConfigError("unknown config key '" + key + "'");
    }
  }
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
  EngineConfig config;
  config.merge(j);
  return config;
}

EngineConfig EngineConfig::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("invalid JSON in config file '" + path + "': " + e.what());
  }
  return fromJson(j);
}

nlohmann::json EngineConfig::toJson() const {
  nlohmann::json j;
  j["error_policy"] = errorPolicyName(error_policy);
  j["log_level"] = observability::logLevelName(log_level);
  j["output_format"] = outputFormatName(output_format);
  j["metrics_file"] = metrics_file;
  return j;
}

}  // namespace config
}  // namespace payments
