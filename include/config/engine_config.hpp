#ifndef PAYMENTS_ENGINE_CONFIG_HPP_
#define PAYMENTS_ENGINE_CONFIG_HPP_

#include "observability/logger.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace payments {
namespace config {

/**
 * What to do when a record cannot be applied.
 */
enum class ErrorPolicy {
  ABORT,  // stop at the first reportable error and fail the run
  SKIP    // log the record, leave state untouched and continue
};

enum class OutputFormat {
  CSV,
  JSON
};

std::optional<ErrorPolicy> parseErrorPolicy(const std::string& name);
std::string errorPolicyName(ErrorPolicy policy);
std::optional<OutputFormat> parseOutputFormat(const std::string& name);
std::string outputFormatName(OutputFormat format);

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Run configuration. Every field has a usable default; a JSON file and the
 * command line may override any of them.
 *
 * Example file:
 *   {"error_policy": "skip", "log_level": "debug",
 *    "output_format": "json", "metrics_file": "metrics.prom"}
 */
struct EngineConfig {
  ErrorPolicy error_policy = ErrorPolicy::ABORT;
  observability::LogLevel log_level = observability::LogLevel::INFO;
  OutputFormat output_format = OutputFormat::CSV;
  std::string metrics_file;

  // Overrides the fields present in `j`. Throws ConfigError on unknown keys,
  // wrong types or unknown enum values.
  void merge(const nlohmann::json& j);

  static EngineConfig fromJson(const nlohmann::json& j);
  static EngineConfig loadFromFile(const std::string& path);

  nlohmann::json toJson() const;
};

}  // namespace config
}  // namespace payments

#endif  // PAYMENTS_ENGINE_CONFIG_HPP_
