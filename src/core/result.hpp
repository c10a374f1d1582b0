/**
 * @file result.hpp
 * @brief Monadic error handling type for CoursePlanner.
 *
 * Provides Result<T, E> as the error-handling mechanism for every planning
 * operation. Errors are values: a cycle found during scheduling or an
 * unknown course in a request aborts that one operation and is handed back
 * to the caller with enough context to render a precise message.
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
#include <vector>

namespace course_planner {

enum class ErrorCode : uint8_t {
    MalformedGraph,     ///< Edge or course record inconsistent with the catalog
    NotFound,           ///< Unknown course, student, program or semester
    CycleDetected,      ///< Operation requiring a DAG met a prerequisite cycle
    InvalidArgument,
    ConfigError,
    IoError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MalformedGraph:  return "malformed_graph";
        case ErrorCode::NotFound:        return "not_found";
        case ErrorCode::CycleDetected:   return "cycle_detected";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::ConfigError:     return "config_error";
        case ErrorCode::IoError:         return "io_error";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and the course
 *        codes involved.
 *
 * For CycleDetected, `courses` holds the cycle in traversal order without
 * repeating the first code at the end.
 */
struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;
    std::vector<std::string> courses;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::vector<std::string> involved = {})
        : code(c), message(std::move(msg)), courses(std::move(involved)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
};

/// Render "A -> B -> C -> A" for a cycle path.
[[nodiscard]] inline std::string format_cycle(const std::vector<std::string>& cycle) {
    std::string out;
    for (const auto& code : cycle) {
        out += code;
        out += " -> ";
    }
    if (!cycle.empty()) out += cycle.front();
    return out;
}

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
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

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    [[nodiscard]] std::string error_text() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "error";
        }
    }

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
Result<T, E> make_error(ErrorCode code, std::string message,
                        std::vector<std::string> courses = {}) {
    return Result<T, E>(E{code, std::move(message), std::move(courses)});
}

/// Shorthand for the common "unknown course" error.
[[nodiscard]] inline Error not_found(std::string_view what, const std::string& key) {
    return Error{ErrorCode::NotFound,
                 std::string{what} + " not found: " + key, {key}};
}

}  // namespace course_planner
