/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <limits>

namespace kube_device {

namespace {

Result<int> check_verbosity(int64_t value) {
    if (value < 0) {
        return Error{ErrorCode::ConfigError, "Verbosity must not be negative"};
    }
    if (value > std::numeric_limits<int>::max()) {
        return Error{ErrorCode::ConfigError, "Verbosity is out of range"};
    }
    return static_cast<int>(value);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.level = logging["level"].value_or(std::string{"info"});
            auto verbosity = check_verbosity(logging["verbosity"].value_or(int64_t{0}));
            if (!verbosity) return verbosity.error();
            config.logging.verbosity = *verbosity;
            config.logging.log_dir = logging["log_dir"].value_or(std::string{});
            config.logging.file_prefix =
                logging["file_prefix"].value_or(std::string{"kube_device_sync"});
        }

        // [sync]
        if (auto sync = tbl["sync"]; sync.is_table()) {
            config.sync.invalidate_on_claim = sync["invalidate_on_claim"].value_or(true);
            config.sync.pod_namespace = sync["namespace"].value_or(std::string{"default"});
        }

        if (!parse_log_level(config.logging.level)) {
            return Error{ErrorCode::ConfigError,
                         "Unknown log level: " + config.logging.level};
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<int> parse_verbosity(std::string_view text) {
    int64_t value = 0;
    const char* last = text.data() + text.size();
    auto [end, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || end != last) {
        return Error{ErrorCode::ConfigError,
                     "Verbosity must be an integer: " + std::string{text}};
    }
    return check_verbosity(value);
}

}  // namespace kube_device
