#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace payments {
namespace observability {

std::optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "debug") return LogLevel::DEBUG;
  if (lowered == "info") return LogLevel::INFO;
  if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
  if (lowered == "error") return LogLevel::ERROR;
  if (lowered == "fatal") return LogLevel::FATAL;
  return std::nullopt;
}

std::string logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
    default: return "UNKNOWN";
  }
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_stream_(&std::cerr) {}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

bool Logger::isEnabled(LogLevel level) const {
  return level >= getLogLevel();
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::debug(const std::string& message, const std::string& component) {
  log(LogLevel::DEBUG, message, component);
}

void Logger::info(const std::string& message, const std::string& component) {
  log(LogLevel::INFO, message, component);
}

void Logger::warn(const std::string& message, const std::string& component) {
  log(LogLevel::WARN, message, component);
}

void Logger::error(const std::string& message, const std::string& component) {
  log(LogLevel::ERROR, message, component);
}

void Logger::fatal(const std::string& message, const std::string& component) {
  log(LogLevel::FATAL, message, component);
}

Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component)
    : level_(level), message_(message), component_(component),
      fields_(nlohmann::json::object()) {}

Logger::LogBuilder::~LogBuilder() {
  Logger::getInstance().log(level_, message_, component_, fields_);
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const std::string& value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const char* value) {
  fields_[key] = std::string(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, int value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, std::uint64_t value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, double value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, bool value) {
  fields_[key] = value;
  return *this;
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::string& component, const nlohmann::json& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < min_level_) return;

  nlohmann::json entry;
  entry["timestamp"] = getCurrentTimestamp();
  entry["level"] = logLevelName(level);
  entry["thread"] = getThreadId();
  entry["message"] = message;

  if (!component.empty()) {
    entry["component"] = component;
  }

  for (const auto& item : fields.items()) {
    entry[item.key()] = item.value();
  }

  // Input text can reach log fields verbatim; invalid UTF-8 is replaced, not thrown.
  *output_stream_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
  output_stream_->flush();
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()) % 1000000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << microseconds.count() << "Z";
  return ss.str();
}

std::string Logger::getThreadId() const {
  std::stringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace observability
}  // namespace payments
