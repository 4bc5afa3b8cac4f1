/**
 * @file result.hpp
 * @brief Monadic error handling type for ToolChainOptimizer.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Plan
 * creation, registration, configuration loading and work executors all
 * report failure through it; exceptions are reserved for engine faults.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace tool_chain {

/**
 * @brief Classification of every failure the engine can report.
 */
enum class ErrorCode : uint8_t {
    ItemNotFound,         ///< Requested or dependent item is not registered
    CircularDependency,   ///< Dependency graph contains a cycle
    DuplicateName,        ///< Strict registration rejected an existing name
    Transient,            ///< Executor failure that may succeed on retry
    Permanent,            ///< Executor failure that is never retried
    InvalidConfig,        ///< Configuration or catalog could not be loaded
    Internal              ///< Engine fault
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ItemNotFound:       return "item_not_found";
        case ErrorCode::CircularDependency: return "circular_dependency";
        case ErrorCode::DuplicateName:      return "duplicate_name";
        case ErrorCode::Transient:          return "transient";
        case ErrorCode::Permanent:          return "permanent";
        case ErrorCode::InvalidConfig:      return "invalid_config";
        case ErrorCode::Internal:           return "internal";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and, for
 *        executor failures, the condition matched against retry policies.
 */
struct Error {
    ErrorCode code{ErrorCode::Internal};
    std::string message;
    std::string condition;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string cond = {})
        : code(c), message(std::move(msg)), condition(std::move(cond)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] bool is_transient() const noexcept { return code == ErrorCode::Transient; }

    /// A transient failure tagged with the given condition (e.g. "timeout").
    static Error transient(std::string condition, std::string msg) {
        return Error{ErrorCode::Transient, std::move(msg), std::move(condition)};
    }

    static Error permanent(std::string msg) {
        return Error{ErrorCode::Permanent, std::move(msg)};
    }
};

/**
 * @brief Result<T, E>: either a success value of type T or an error of type E.
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

    /// Transform the error, leaving a success value untouched.
    template <typename F>
    auto map_error(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        if (has_value()) {
            return std::get<T>(std::move(storage_));
        }
        return func(std::get<E>(std::move(storage_)));
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

}  // namespace tool_chain
