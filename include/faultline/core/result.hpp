// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Result type for error propagation without exceptions

#ifndef FAULTLINE_CORE_RESULT_HPP
#define FAULTLINE_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace faultline {
namespace core {

/**
 * @brief Either a success value of type T or an error of type E.
 *
 * Every fallible operation in Faultline returns a Result. Accessing the
 * wrong alternative throws std::logic_error, which indicates a programming
 * error in the caller rather than a runtime failure.
 *
 * @tparam T The success value type
 * @tparam E The error type
 */
template<typename T, typename E>
class Result {
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
     * @throws std::logic_error if this holds an error
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
     * @brief Access the error value.
     * @throws std::logic_error if this holds a success value
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
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v)
        : storage_(tag, std::forward<V>(v)) {}

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

    // Indexed alternatives so that T and E may be the same type.
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that produce no value on success.
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result(true, E{});
    }

    static Result error(E err) {
        return Result(false, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return ok_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return !ok_;
    }

    [[nodiscard]] E& error() & {
        if (ok_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (ok_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result(bool ok, E err)
        : error_(std::move(err)), ok_(ok) {}

    E error_;
    bool ok_;
};

} // namespace core
} // namespace faultline

#endif // FAULTLINE_CORE_RESULT_HPP
