/**
 * @file result.hpp
 * @brief Monadic error handling type for KubeDeviceSync.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Every
 * operation that talks to the object store, parses an annotation or builds
 * a patch returns one of these instead of throwing.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace kube_device {

// ─────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Unknown,
    SerializationError,     ///< Private model could not be encoded
    DeserializationError,   ///< Annotation present but not a valid encoding
    DiffError,              ///< Object could not be serialized for diffing
    PatchApplyError,        ///< Store rejected or failed a patch application
    IdentityMismatch,       ///< Restricted update target differs from live object
    NotFound,               ///< Object does not exist in the store
    Conflict,               ///< Optimistic concurrency check failed
    Invalid,                ///< Store validation rejected the change
    ConfigError,
    IoError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:              return "unknown";
        case ErrorCode::SerializationError:   return "serialization";
        case ErrorCode::DeserializationError: return "deserialization";
        case ErrorCode::DiffError:            return "diff";
        case ErrorCode::PatchApplyError:      return "patch_apply";
        case ErrorCode::IdentityMismatch:     return "identity_mismatch";
        case ErrorCode::NotFound:             return "not_found";
        case ErrorCode::Conflict:             return "conflict";
        case ErrorCode::Invalid:              return "invalid";
        case ErrorCode::ConfigError:          return "config";
        case ErrorCode::IoError:              return "io";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and an optional cause.
 *
 * Wrapping an error keeps the original as `cause`, so callers can always get
 * back to what the store actually reported via root().
 */
struct Error {
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
    std::string sub_resource;                 ///< Set on PatchApplyError
    std::shared_ptr<const Error> cause;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }

    /// Innermost error of the cause chain (this error if it has no cause).
    [[nodiscard]] const Error& root() const noexcept {
        const Error* e = this;
        while (e->cause) e = e->cause.get();
        return *e;
    }

    /// Message including the whole cause chain, outermost first.
    [[nodiscard]] std::string full_message() const {
        std::string out = message;
        for (const Error* e = cause.get(); e != nullptr; e = e->cause.get()) {
            out += ": ";
            out += e->message;
        }
        return out;
    }

    /// Build a new error of `c` that keeps `*this` as its cause.
    [[nodiscard]] Error wrap(ErrorCode c, std::string context) const {
        Error outer{c, std::move(context)};
        outer.cause = std::make_shared<const Error>(*this);
        return outer;
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace kube_device
