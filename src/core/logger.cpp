/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 */

#include "core/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kube_device {

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn")  return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level, int verbosity)
    : sink_(std::move(sink)), min_level_(min_level), verbosity_(verbosity) {}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::v(int v, std::string_view message) {
    if (!enabled(v)) return;
    emit(LogLevel::Debug, message, v);
}

bool Logger::enabled(int v) const noexcept { return v <= verbosity_; }

void Logger::log(LogLevel level, std::string_view message) {
    if (level < min_level_) return;
    emit(level, message, std::nullopt);
}

void Logger::emit(LogLevel level, std::string_view message, std::optional<int> v) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream ts;
    ts << std::put_time(std::gmtime(&time_t_now), "%FT%T")
       << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    nlohmann::json record = {
        {"level", std::string{to_string(level)}},
        {"ts", ts.str()},
        {"msg", std::string{message}},
    };
    if (v) record["v"] = *v;

    // Messages may carry raw annotation bytes; never let a bad byte abort logging.
    auto line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard lock(mutex_);
    sink_->write(line);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

void Logger::set_verbosity(int verbosity) noexcept { verbosity_ = verbosity; }
int Logger::verbosity() const noexcept { return verbosity_; }

}  // namespace kube_device
