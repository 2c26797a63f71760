#include "config/engine_config.hpp"
#include "io/account_presenter.hpp"
#include "io/csv_mutation_reader.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "payments_engine_impl.hpp"
#include "processing/transaction_processor.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

const char* const kUsage =
    "Usage: payments_engine <transactions.csv> [--config FILE] [--format csv|json]\n"
    "                       [--error-policy abort|skip] [--log-level LEVEL]\n"
    "                       [--metrics-file FILE] > accounts.csv\n";

struct CommandLine {
  std::string input_path;
  std::optional<std::string> config_path;
  std::optional<std::string> format;
  std::optional<std::string> error_policy;
  std::optional<std::string> log_level;
  std::optional<std::string> metrics_file;
};

// Returns nullopt and prints usage on malformed arguments.
std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) return std::nullopt;
      return std::string(argv[++i]);
    };

    std::optional<std::string>* target = nullptr;
    if (arg == "--config") {
      target = &cmd.config_path;
    } else if (arg == "--format") {
      target = &cmd.format;
    } else if (arg == "--error-policy") {
      target = &cmd.error_policy;
    } else if (arg == "--log-level") {
      target = &cmd.log_level;
    } else if (arg == "--metrics-file") {
      target = &cmd.metrics_file;
    } else if (arg == "--skip-errors") {
      cmd.error_policy = "skip";
      continue;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option " << arg << "\n" << kUsage;
      return std::nullopt;
    } else if (cmd.input_path.empty()) {
      cmd.input_path = arg;
      continue;
    } else {
      std::cerr << "Unexpected argument " << arg << "\n" << kUsage;
      return std::nullopt;
    }

    *target = value();
    if (!target->has_value()) {
      std::cerr << "Option " << arg << " needs a value\n" << kUsage;
      return std::nullopt;
    }
  }

  if (cmd.input_path.empty()) {
    std::cerr << kUsage;
    return std::nullopt;
  }
  return cmd;
}

// Command-line flags take precedence over the config file.
payments::config::EngineConfig buildConfig(const CommandLine& cmd) {
  using payments::config::EngineConfig;
  EngineConfig config = cmd.config_path ? EngineConfig::loadFromFile(*cmd.config_path)
                                        : EngineConfig{};

  nlohmann::json overrides = nlohmann::json::object();
  if (cmd.format) overrides["output_format"] = *cmd.format;
  if (cmd.error_policy) overrides["error_policy"] = *cmd.error_policy;
  if (cmd.log_level) overrides["log_level"] = *cmd.log_level;
  if (cmd.metrics_file) overrides["metrics_file"] = *cmd.metrics_file;
  config.merge(overrides);
  return config;
}

bool writeMetrics(const std::string& path) {
  std::ofstream out(path);
  if (!out) {
    return false;
  }
  out << payments::observability::getGlobalMetrics().exportMetrics();
  return static_cast<bool>(out);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace payments;

  auto cmd = parseCommandLine(argc, argv);
  if (!cmd) {
    return 1;
  }

  auto& logger = observability::Logger::getInstance();
  logger.setOutputStream(std::cerr);

  try {
    const config::EngineConfig engine_config = buildConfig(*cmd);
    logger.setLogLevel(engine_config.log_level);

    LOG_BUILDER(observability::LogLevel::DEBUG, "Starting payments engine")
        .field("input", cmd->input_path)
        .field("config", engine_config.toJson().dump());

    std::ifstream input(cmd->input_path);
    if (!input) {
      LOG_ERROR("Cannot open input file " + cmd->input_path);
      std::cerr << "The transaction engine failed with message:\n"
                << "cannot open " << cmd->input_path << std::endl;
      return 1;
    }

    PaymentsEngineImpl engine;
    processing::TransactionProcessor processor(&engine, engine_config.error_policy);
    io::CsvMutationReader reader(input);

    const bool completed = processor.processAll(reader);

    if (!engine_config.metrics_file.empty() && !writeMetrics(engine_config.metrics_file)) {
      LOG_WARN("Failed to write metrics to " + engine_config.metrics_file);
    }

    if (!completed) {
      std::cerr << "The transaction engine failed with message:\n"
                << processor.failure().value_or("unknown error") << std::endl;
      return 1;
    }

    if (engine_config.output_format == config::OutputFormat::JSON) {
      std::cout << io::accountsToJson(engine.Accounts()).dump(2) << std::endl;
    } else {
      io::writeAccountsCsv(std::cout, engine.Accounts());
    }
  } catch (const std::exception& e) {
    LOG_FATAL(e.what());
    std::cerr << "The transaction engine failed with message:\n" << e.what() << std::endl;
    return 1;
  }

  return 0;
}
