/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions
 *
 * Distinguishes between success (T) and expected failures (E). An error carries
 * the enum kind, an integer code (typically an errno from the transport) and a
 * human-readable message.
 *
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] prevents ignoring errors
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace plexus
{

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type (may be void, see the specialization below)
 * @tparam E Error enum type (should be an enum or enum class)
 *
 * Usage:
 * @code
 * Result<int, ErrorKind> compute() {
 *     if (condition) {
 *         return Result<int, ErrorKind>::ok(42);
 *     }
 *     return Result<int, ErrorKind>::error(ErrorKind::InvalidTopic, "topic is empty");
 * }
 *
 * auto result = compute();
 * if (result.is_ok()) {
 *     int value = result.content();
 * } else {
 *     LOGGER_WARN("compute failed: {}", result.error_message());
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    // ====================================================================
    // Construction - Use static factory methods for clarity
    // ====================================================================

    /**
     * @brief Create a successful Result containing a value
     * @param value The success value (moved into Result)
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data.template emplace<T>(std::move(value));
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error enum value
     * @param message Human-readable cause (default empty)
     * @param code Optional detailed error code (default 0)
     */
    [[nodiscard]] static Result error(E err, std::string message = {}, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code, std::move(message)};
        return result;
    }

    /**
     * @brief Re-wrap the error of another Result with a different value type.
     * @pre other.is_error()
     */
    template <typename U>
    [[nodiscard]] static Result error_from(const Result<U, E> &other)
    {
        return error(other.error(), other.error_message(), other.error_code());
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0, {}}) {}

    // Movable but not copyable (to avoid accidental copies of large values)
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;

    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }

    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Get the success content (const reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     *
     * After this call, Result is left in a valid but unspecified state.
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /**
     * @brief Get the error enum value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        return error_data("Result::error() called on success state").error_enum;
    }

    /**
     * @brief Get the detailed error code (0 if not set)
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        return error_data("Result::error_code() called on success state").error_code;
    }

    /**
     * @brief Get the human-readable error message (may be empty)
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] const std::string &error_message() const
    {
        return error_data("Result::error_message() called on success state").message;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
        std::string message;
    };

    const ErrorData &error_data(const char *what) const
    {
        if (is_ok())
        {
            throw std::logic_error(what);
        }
        return std::get<ErrorData>(m_data);
    }

    // Storage: either T (success) or ErrorData (failure)
    std::variant<T, ErrorData> m_data;
};

/**
 * @brief Result specialization for operations that return nothing on success.
 */
template <typename E>
class Result<void, E>
{
  public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok()
    {
        Result result;
        result.m_ok = true;
        return result;
    }

    [[nodiscard]] static Result error(E err, std::string message = {}, int code = 0)
    {
        Result result;
        result.m_ok = false;
        result.m_error = err;
        result.m_code = code;
        result.m_message = std::move(message);
        return result;
    }

    template <typename U>
    [[nodiscard]] static Result error_from(const Result<U, E> &other)
    {
        return error(other.error(), other.error_message(), other.error_code());
    }

    Result() = default;

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;

    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return m_ok; }

    [[nodiscard]] bool is_error() const noexcept { return !m_ok; }

    [[nodiscard]] E error() const
    {
        check_error("Result::error() called on success state");
        return m_error;
    }

    [[nodiscard]] int error_code() const
    {
        check_error("Result::error_code() called on success state");
        return m_code;
    }

    [[nodiscard]] const std::string &error_message() const
    {
        check_error("Result::error_message() called on success state");
        return m_message;
    }

  private:
    void check_error(const char *what) const
    {
        if (m_ok)
        {
            throw std::logic_error(what);
        }
    }

    bool m_ok{false};
    E m_error{};
    int m_code{0};
    std::string m_message;
};

} // namespace plexus
