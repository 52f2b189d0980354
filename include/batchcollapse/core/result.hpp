// BatchCollapse - Coalescing retention timer
// Result type for fallible setup operations

#ifndef BATCHCOLLAPSE_CORE_RESULT_HPP
#define BATCHCOLLAPSE_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace batchcollapse {
namespace core {

/**
 * @brief Either a success value or an error.
 *
 * Used by the setup paths (timer scheduling, driver start, signal hook
 * installation, configuration loading). The hot paths of the engine
 * (collapse/cancel) never fail and do not use it.
 *
 * @tparam T Success value type
 * @tparam E Error type (must differ from T)
 */
template<typename T, typename E>
class Result {
    static_assert(!std::is_same<T, E>::value,
                  "Result requires distinct success and error types");

public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

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
     * @throws std::logic_error on an error result
     */
    [[nodiscard]] T& value() & {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireSuccess();
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Access the error.
     * @throws std::logic_error on a success result
     */
    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] T valueOr(T fallback) const& {
        return isSuccess() ? std::get<0>(storage_) : fallback;
    }

    [[nodiscard]] T valueOr(T fallback) && {
        return isSuccess() ? std::get<0>(std::move(storage_)) : fallback;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : storage_(tag, std::forward<U>(payload)) {}

    void requireSuccess() const {
        if (!isSuccess()) {
            throw std::logic_error("Attempted to access value on error result");
        }
    }

    void requireError() const {
        if (!isError()) {
            throw std::logic_error("Attempted to access error on success result");
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result of an operation that yields nothing on success.
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
     * @throws std::logic_error on a success result
     */
    [[nodiscard]] E& error() & {
        if (!failed_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (!failed_) {
            throw std::logic_error("Attempted to access error on success result");
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
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_CORE_RESULT_HPP
