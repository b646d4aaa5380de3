// Orexa - Game Server Supervisor
// Result type for error handling without exceptions

#ifndef OREXA_CORE_RESULT_HPP
#define OREXA_CORE_RESULT_HPP

#include <variant>
#include <utility>
#include <stdexcept>
#include <type_traits>

namespace orexa {
namespace core {

/**
 * @brief Either a success value or an error.
 *
 * Every fallible supervisor operation returns a Result. Accessing the wrong
 * alternative throws std::logic_error, which indicates a programming error
 * rather than a runtime failure.
 *
 * @tparam T The success value type
 * @tparam E The error type
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::move(value), true);
    }

    static Result error(E err) {
        return Result(std::move(err), false);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return isSuccessFlag_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return !isSuccessFlag_;
    }

    /**
     * @brief Get the success value.
     * @throws std::logic_error if called on an error result
     */
    [[nodiscard]] T& value() & {
        if (!isSuccessFlag_) {
            throw std::logic_error("Attempted to access value on error result");
        }
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!isSuccessFlag_) {
            throw std::logic_error("Attempted to access value on error result");
        }
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!isSuccessFlag_) {
            throw std::logic_error("Attempted to access value on error result");
        }
        return std::get<T>(std::move(storage_));
    }

    /**
     * @brief Get the error value.
     * @throws std::logic_error if called on a success result
     */
    [[nodiscard]] E& error() & {
        if (isSuccessFlag_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (isSuccessFlag_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return std::get<E>(storage_);
    }

    /**
     * @brief Get the success value, or a fallback when this is an error.
     */
    [[nodiscard]] T valueOr(T defaultValue) const& {
        if (isSuccessFlag_) {
            return std::get<T>(storage_);
        }
        return defaultValue;
    }

    [[nodiscard]] T valueOr(T defaultValue) && {
        if (isSuccessFlag_) {
            return std::get<T>(std::move(storage_));
        }
        return defaultValue;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result(T value, bool /* isSuccess */)
        : storage_(std::in_place_index<0>, std::move(value)), isSuccessFlag_(true) {}

    Result(E err, bool /* isSuccess */)
        : storage_(std::in_place_index<1>, std::move(err)), isSuccessFlag_(false) {}

    std::variant<T, E> storage_;
    bool isSuccessFlag_;
};

/**
 * @brief Result of an operation that yields nothing on success.
 *
 * @tparam E The error type
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result(true);
    }

    static Result error(E err) {
        return Result(std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return isSuccessFlag_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return !isSuccessFlag_;
    }

    /**
     * @brief Get the error value.
     * @throws std::logic_error if called on a success result
     */
    [[nodiscard]] E& error() & {
        if (isSuccessFlag_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (isSuccessFlag_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    explicit Result(bool /* isSuccess */)
        : error_{}, isSuccessFlag_(true) {}

    explicit Result(E err)
        : error_(std::move(err)), isSuccessFlag_(false) {}

    E error_;
    bool isSuccessFlag_;
};

} // namespace core
} // namespace orexa

#endif // OREXA_CORE_RESULT_HPP
