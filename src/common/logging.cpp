#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <thread>

namespace solcore {
namespace common {

std::optional<LogLevel> parse_log_level(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "TRACE")
    return LogLevel::TRACE;
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "INFO")
    return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "CRITICAL")
    return LogLevel::CRITICAL;
  return std::nullopt;
}

std::string log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::get_thread_id() const {
  std::ostringstream oss;
  oss << std::this_thread::get_id();
  return oss.str();
}

std::string Logger::escape_json_string(const std::string &input) const {
  std::ostringstream escaped;
  for (char c : input) {
    switch (c) {
    case '"':
      escaped << "\\\"";
      break;
    case '\\':
      escaped << "\\\\";
      break;
    case '\b':
      escaped << "\\b";
      break;
    case '\f':
      escaped << "\\f";
      break;
    case '\n':
      escaped << "\\n";
      break;
    case '\r':
      escaped << "\\r";
      break;
    case '\t':
      escaped << "\\t";
      break;
    default:
      if (c >= 0 && c < 32) {
        escaped << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                << static_cast<int>(c);
      } else {
        escaped << c;
      }
      break;
    }
  }
  return escaped.str();
}

std::string Logger::format_json(const LogEntry &entry) const {
  std::ostringstream json;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()) %
            1000;
  std::tm utc{};
  gmtime_r(&time_t, &utc);

  json << "{" << "\"timestamp\":\"" << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\","
       << "\"level\":\"" << log_level_name(entry.level) << "\","
       << "\"module\":\"" << escape_json_string(entry.module) << "\","
       << "\"thread_id\":\"" << escape_json_string(entry.thread_id) << "\","
       << "\"message\":\"" << escape_json_string(entry.message) << "\"";

  if (!entry.error_code.empty()) {
    json << ",\"error_code\":\"" << escape_json_string(entry.error_code)
         << "\"";
  }

  if (!entry.context.empty()) {
    // Sorted so identical entries render identically
    std::map<std::string, std::string> ordered(entry.context.begin(),
                                               entry.context.end());
    json << ",\"context\":{";
    bool first = true;
    for (const auto &[key, value] : ordered) {
      if (!first)
        json << ",";
      json << "\"" << escape_json_string(key) << "\":\""
           << escape_json_string(value) << "\"";
      first = false;
    }
    json << "}";
  }

  json << "}";
  return json.str();
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  std::tm local{};
  localtime_r(&time_t, &local);

  text << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] " << "["
       << log_level_name(entry.level) << "] " << "[" << entry.module << "] "
       << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  if (!entry.context.empty()) {
    std::map<std::string, std::string> ordered(entry.context.begin(),
                                               entry.context.end());
    text << " {";
    bool first = true;
    for (const auto &[key, value] : ordered) {
      if (!first)
        text << ", ";
      text << key << "=" << value;
      first = false;
    }
    text << "}";
  }

  return text.str();
}

} // namespace common
} // namespace solcore
