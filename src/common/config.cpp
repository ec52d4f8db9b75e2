#include "common/config.h"
#include <fstream>
#include <sstream>

namespace solcore {
namespace common {

using json = nlohmann::json;

namespace {

constexpr const char *POLICY_REJECT = "reject";
constexpr const char *POLICY_REPORT = "report";

} // namespace

std::string to_string(TruncatedTransferPolicy policy) {
  switch (policy) {
  case TruncatedTransferPolicy::Reject:
    return POLICY_REJECT;
  case TruncatedTransferPolicy::Report:
    return POLICY_REPORT;
  }
  return POLICY_REJECT;
}

CoreConfig ConfigManager::create_default() { return CoreConfig{}; }

Result<CoreConfig> ConfigManager::load_from_json(const json &j) {
  if (!j.is_object()) {
    return Result<CoreConfig>("Configuration root must be a JSON object");
  }

  try {
    CoreConfig config = create_default();

    config.log_level = j.value("log_level", config.log_level);
    config.json_logs = j.value("json_logs", config.json_logs);

    if (j.contains("truncated_transfer_policy")) {
      std::string policy = j["truncated_transfer_policy"].get<std::string>();
      if (policy == POLICY_REJECT) {
        config.truncated_transfer_policy = TruncatedTransferPolicy::Reject;
      } else if (policy == POLICY_REPORT) {
        config.truncated_transfer_policy = TruncatedTransferPolicy::Report;
      } else {
        return Result<CoreConfig>::failure(
            "Invalid truncated_transfer_policy: " + policy);
      }
    }

    std::string error = validate_config(config);
    if (!error.empty()) {
      return Result<CoreConfig>::failure(error);
    }

    return Result<CoreConfig>(std::move(config));
  } catch (const json::exception &e) {
    return Result<CoreConfig>::failure("JSON parsing error: " +
                                       std::string(e.what()));
  }
}

Result<CoreConfig> ConfigManager::load_from_file(const std::string &config_path) {
  std::ifstream file(config_path);
  if (!file) {
    return Result<CoreConfig>::failure("Configuration file not found: " +
                                       config_path);
  }

  std::ostringstream content;
  content << file.rdbuf();

  json j = json::parse(content.str(), nullptr, false);
  if (j.is_discarded()) {
    return Result<CoreConfig>::failure("Invalid JSON in " + config_path);
  }
  return load_from_json(j);
}

json ConfigManager::to_json(const CoreConfig &config) {
  json j;
  j["log_level"] = config.log_level;
  j["json_logs"] = config.json_logs;
  j["truncated_transfer_policy"] = to_string(config.truncated_transfer_policy);
  return j;
}

std::string ConfigManager::validate_config(const CoreConfig &config) {
  if (!parse_log_level(config.log_level)) {
    return "Invalid log level: " + config.log_level;
  }
  return "";
}

void ConfigManager::apply_logging(const CoreConfig &config) {
  auto level = parse_log_level(config.log_level);
  auto &logger = Logger::instance();
  logger.set_level(level.value_or(LogLevel::INFO));
  logger.set_json_format(config.json_logs);
}

} // namespace common
} // namespace solcore
