/**
 * @file result.hpp
 * @brief Monadic error handling type for WorkloadRouter.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Every
 * failure carries an ErrorCode from the routing error taxonomy so callers
 * can tell terminal errors (invalid task, no eligible node) from retriable
 * ones (capacity race lost) without parsing messages.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace workload_router {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Generic,
    InvalidTask,            ///< Malformed task, terminal
    NoEligibleNode,         ///< No node satisfies hard constraints, terminal
    SchemaMismatch,         ///< Extractor/classifier version skew
    CapacityExceeded,       ///< Reservation race lost, caller may retry
    UnknownNode,            ///< Registry misuse
    DuplicateNode,          ///< Registry misuse
    ClassifierUnavailable,  ///< Predictor missing or failed
    InvalidConfig,
    Io
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:               return "error";
        case ErrorCode::InvalidTask:           return "invalid_task";
        case ErrorCode::NoEligibleNode:        return "no_eligible_node";
        case ErrorCode::SchemaMismatch:        return "schema_mismatch";
        case ErrorCode::CapacityExceeded:      return "capacity_exceeded";
        case ErrorCode::UnknownNode:           return "unknown_node";
        case ErrorCode::DuplicateNode:         return "duplicate_node";
        case ErrorCode::ClassifierUnavailable: return "classifier_unavailable";
        case ErrorCode::InvalidConfig:         return "invalid_config";
        case ErrorCode::Io:                    return "io";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and optional
 *        per-item details (e.g. one line per rejected node).
 */
struct Error {
    ErrorCode code{ErrorCode::Generic};
    std::string message;
    std::vector<std::string> details;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::vector<std::string> detail_lines = {})
        : code(c), message(std::move(msg)), details(std::move(detail_lines)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }

    /// Message followed by each detail line, for logs and CLI output.
    [[nodiscard]] std::string describe() const {
        std::string out{to_string(code)};
        out += ": ";
        out += message;
        for (const auto& line : details) {
            out += "\n  - ";
            out += line;
        }
        return out;
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 * T may be move-only; copy-based members are only instantiated when used.
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

}  // namespace workload_router
