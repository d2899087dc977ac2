// StreamProv - Dedicated stream provisioning service
// Result type used for all fallible operations

#ifndef STREAMPROV_CORE_RESULT_HPP
#define STREAMPROV_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace streamprov {
namespace core {

/**
 * @brief Either a success value or a structured error.
 *
 * Components never let exceptions cross their public boundary; every
 * operation that can fail returns a Result and callers branch on
 * isSuccess()/isError(). Accessing the wrong alternative throws
 * std::logic_error, which indicates a programming error in the caller.
 *
 * @tparam T Success value type
 * @tparam E Error type (a component error struct with a nested Code)
 */
template<typename T, typename E>
class Result {
public:
    /**
     * @brief Build a successful result.
     */
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /**
     * @brief Build a failed result.
     */
    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    /**
     * @brief Access the success value.
     * @throws std::logic_error if this result holds an error
     */
    [[nodiscard]] T& value() & {
        requireValue();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireValue();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireValue();
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Access the error.
     * @throws std::logic_error if this result holds a value
     */
    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    /**
     * @brief The success value, or the fallback when this is an error.
     */
    [[nodiscard]] T valueOr(T fallback) const& {
        return isSuccess() ? std::get<0>(storage_) : std::move(fallback);
    }

    [[nodiscard]] T valueOr(T fallback) && {
        return isSuccess() ? std::get<0>(std::move(storage_)) : std::move(fallback);
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : storage_(tag, std::forward<U>(payload)) {}

    void requireValue() const {
        if (!isSuccess()) {
            throw std::logic_error("Result: value() called on an error result");
        }
    }

    void requireError() const {
        if (!isError()) {
            throw std::logic_error("Result: error() called on a success result");
        }
    }

    // Index 0 holds the value, index 1 the error, so T and E may be the same type.
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that produce no value on success.
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        return Result(std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return !failed_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return failed_;
    }

    /**
     * @brief Access the error.
     * @throws std::logic_error if this result is a success
     */
    [[nodiscard]] E& error() & {
        if (!failed_) {
            throw std::logic_error("Result: error() called on a success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (!failed_) {
            throw std::logic_error("Result: error() called on a success result");
        }
        return error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result() : error_{}, failed_(false) {}

    explicit Result(E err) : error_(std::move(err)), failed_(true) {}

    E error_;
    bool failed_;
};

} // namespace core
} // namespace streamprov

#endif // STREAMPROV_CORE_RESULT_HPP
