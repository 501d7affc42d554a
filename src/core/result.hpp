#pragma once

#include "core/error.hpp"
#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace vellum {

/**
 * Result<T, E> - Either a value (ok) or an error (err).
 *
 * Every fallible operation in vellum returns one of these instead of
 * throwing. unwrap() throws only when the caller did not check first.
 *
 *   auto key = derive_key(phrase, "encryption", params);
 *   if (key.is_err()) return Result<Session, Error>::err(key.unwrap_err());
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    [[nodiscard]] T& unwrap() & {
        check_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        check_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        check_ok();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void check_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).describe());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " + error_.describe());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

using Status = Result<void, Error>;

} // namespace vellum
