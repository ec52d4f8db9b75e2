#pragma once

#include "common/logging.h"
#include "common/types.h"
#include <nlohmann/json.hpp>
#include <string>

namespace solcore {
namespace common {

/**
 * @brief What the dispatcher does with a Transfer whose payload is too short
 *
 * The codec always fails fast on short buffers. For Transfer the dispatcher
 * can instead answer with an informational no-op result; that behaviour is
 * opt-in and never the default.
 */
enum class TruncatedTransferPolicy {
    Reject, ///< fail with TruncatedInput, same as the codec
    Report  ///< succeed with a Skipped operation result describing the payload
};

std::string to_string(TruncatedTransferPolicy policy);

/**
 * @brief Runtime configuration for the core and the CLI around it
 *
 * @note The rent-exemption threshold is the compile-time constant
 *       Account::RENT_EXEMPT_MIN_LAMPORTS, not a setting.
 */
struct CoreConfig {
    std::string log_level = "info";  ///< trace/debug/info/warn/error/critical
    bool json_logs = false;          ///< emit JSON lines instead of text
    TruncatedTransferPolicy truncated_transfer_policy = TruncatedTransferPolicy::Reject;
};

/**
 * @brief Configuration loader and validator
 */
class ConfigManager {
public:
    /**
     * @brief Create default configuration
     */
    static CoreConfig create_default();

    /**
     * @brief Load configuration from a JSON object
     *
     * Missing keys keep their defaults. Keys of the wrong type, unknown
     * policies and unknown log levels are errors.
     */
    static Result<CoreConfig> load_from_json(const nlohmann::json& json);

    /**
     * @brief Load configuration from a JSON file
     * @param config_path path to configuration file
     */
    static Result<CoreConfig> load_from_file(const std::string& config_path);

    /**
     * @brief Convert configuration to JSON object
     */
    static nlohmann::json to_json(const CoreConfig& config);

    /**
     * @brief Validate configuration
     * @return validation error message, or empty string if valid
     */
    static std::string validate_config(const CoreConfig& config);

    /**
     * @brief Push log level and format into the Logger singleton
     */
    static void apply_logging(const CoreConfig& config);
};

} // namespace common
} // namespace solcore
