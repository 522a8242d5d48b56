/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions
 *
 * Design Philosophy:
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] prevents ignoring errors
 *
 * An error carries the error enum, an optional OS-level code (errno or
 * std::error_code value) and a human-readable detail string naming the failing
 * path and the underlying cause.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace scenefix::utils
{

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type (use std::monostate, via Status<E>, for operations with
 *           no value)
 * @tparam E Error enum type (should be an enum or enum class)
 *
 * Usage:
 * @code
 * Result<SceneDocument, RepairErrc> parse(const std::string &text) {
 *     if (!well_formed) {
 *         return Result<SceneDocument, RepairErrc>::error(RepairErrc::Parse, 0, "bad indent");
 *     }
 *     return Result<SceneDocument, RepairErrc>::ok(std::move(doc));
 * }
 *
 * auto result = parse(text);
 * if (result.is_ok()) {
 *     use(result.content());
 * } else {
 *     log(result.error(), result.detail());
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

    /**
     * @brief Create a successful Result containing a value
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error enum value
     * @param code Optional OS-level error code (default 0)
     * @param detail Optional human-readable description of the failure
     */
    [[nodiscard]] static Result error(E err, int code = 0, std::string detail = {})
    {
        Result result;
        result.m_data = ErrorData{err, code, std::move(detail)};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0, {}}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;

    // Copies are explicit only; documents can be large.
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }

    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Get the success content
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

    /**
     * @brief Get the error enum value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    /**
     * @brief Get the OS-level error code (0 if not set)
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

    /**
     * @brief Get the failure description (empty on success)
     */
    [[nodiscard]] const std::string &detail() const noexcept
    {
        static const std::string kEmpty;
        if (is_ok())
        {
            return kEmpty;
        }
        return std::get<ErrorData>(m_data).detail;
    }

    /**
     * @brief Re-wrap this error as a Result of another value type.
     * @throws std::logic_error if Result is in success state
     */
    template <typename U>
    [[nodiscard]] Result<U, E> forward_error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::forward_error() called on success state");
        }
        const auto &err = std::get<ErrorData>(m_data);
        return Result<U, E>::error(err.error_enum, err.error_code, err.detail);
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
        std::string detail;
    };

    std::variant<T, ErrorData> m_data;
};

/**
 * @brief Result for operations that produce no value.
 */
template <typename E>
using Status = Result<std::monostate, E>;

} // namespace scenefix::utils
