#pragma once
/**
 * @file repair_service_config.hpp
 * @brief Repair service configuration, loaded from a JSON file.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "scene_path":      "/config/scenes.yaml",
 *   "log_level":       "info",
 *   "log_file":        "/var/log/scenefix.log",
 *   "lock_timeout_ms": 5000,
 *   "verify_content":  true
 * }
 * @endcode
 *
 * Every field is optional. Command-line flags override the file.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "scenefix_utils_export.h"
#include "utils/logger.hpp"

namespace scenefix::repair
{

/**
 * @struct RepairServiceConfig
 * @brief Settings for the repair front end and the pipeline it drives.
 */
struct SCENEFIX_UTILS_EXPORT RepairServiceConfig
{
    std::string scene_path;       ///< Default document path when none is given on the command line
    std::string log_level{"info"}; ///< trace/debug/info/warning/error/system
    std::string log_file;         ///< Empty = log to stderr

    /// Per-path lock wait in ms.
    ///  -1  = wait indefinitely
    ///   0  = fail immediately if another repair holds the lock
    ///  >0  = give up after N ms
    int64_t lock_timeout_ms{-1};

    /// Compare the reloaded document with the repaired one after writing, not only
    /// re-parse it.
    bool verify_content{true};

    /** @brief The log level as a Logger::Level (validated during parsing). */
    [[nodiscard]] utils::Logger::Level level() const;

    /** @brief std::nullopt when the lock wait is unbounded. */
    [[nodiscard]] std::optional<std::chrono::milliseconds> lock_timeout() const;

    /**
     * @brief Parses an already-loaded JSON object.
     * @throws std::runtime_error on a wrong type or an invalid value.
     */
    static RepairServiceConfig from_json(const nlohmann::json &j, const std::string &origin = "");

    /**
     * @brief Loads and parses a configuration file.
     * @throws std::runtime_error if the file cannot be opened, is not valid JSON, or holds
     *         invalid values.
     */
    static RepairServiceConfig from_json_file(const std::string &path);
};

} // namespace scenefix::repair
