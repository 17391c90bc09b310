/**
 * @file config.hpp
 * @brief Tool configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace kube_device {

struct LoggingConfig {
    std::string level = "info";             ///< "debug", "info", "warn", "error"
    int verbosity = 0;                      ///< klog-style V level
    std::filesystem::path log_dir;          ///< Empty = stdout
    std::string file_prefix = "kube_device_sync";
};

struct SyncConfig {
    bool invalidate_on_claim = true;
    std::string pod_namespace = "default";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    LoggingConfig logging;
    SyncConfig sync;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Parse a verbosity override such as the CLI's `--verbosity`.
 *
 * The file's `logging.verbosity` follows the same rule: a non-negative int.
 */
Result<int> parse_verbosity(std::string_view text);

}  // namespace kube_device
