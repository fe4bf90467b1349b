#pragma once

#include "formsave/core/ErrorCode.hpp"
#include "formsave/core/Exception.hpp"
#include <type_traits>
#include <utility>
#include <variant>

namespace formsave {
namespace core {

/**
 * @brief Expected<T, E> - 两态结果：成功值或错误
 *
 * 叶子IO调用（fill / write / open / remove）的返回类型。
 * 三态（含部分完成）的结果见 SaveResult。
 */
template<typename T, typename E = Error>
class Expected {
private:
    std::variant<T, E> storage_;

public:
    using value_type = T;
    using error_type = E;

    // ========== 构造函数 ==========

    Expected(const T& value) : storage_(std::in_place_index<0>, value) {}
    Expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

    Expected(const E& error) : storage_(std::in_place_index<1>, error) {}
    Expected(E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return storage_.index() == 0; }
    bool hasError() const noexcept { return storage_.index() == 1; }

    explicit operator bool() const noexcept { return hasValue(); }

    // ========== 值访问 ==========

    T& value() & { return std::get<0>(storage_); }
    const T& value() const & { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    E& error() & { return std::get<1>(storage_); }
    const E& error() const & { return std::get<1>(storage_); }
    E&& error() && { return std::get<1>(std::move(storage_)); }

    T valueOr(T default_value) const & {
        return hasValue() ? value() : std::move(default_value);
    }

    T valueOr(T default_value) && {
        return hasValue() ? std::move(*this).value() : std::move(default_value);
    }

    T& operator*() & { return value(); }
    const T& operator*() const & { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    // ========== 函数式操作 ==========

    /**
     * @brief 映射操作（成功时）
     */
    template<typename F>
    auto map(F&& func) && -> Expected<std::invoke_result_t<F, T&&>, E> {
        using U = std::invoke_result_t<F, T&&>;
        if (hasValue()) {
            return Expected<U, E>(std::forward<F>(func)(std::move(*this).value()));
        }
        return Expected<U, E>(std::move(*this).error());
    }

    /**
     * @brief 映射操作（失败时）
     */
    template<typename F>
    auto mapError(F&& func) && -> Expected<T, std::invoke_result_t<F, E&&>> {
        using G = std::invoke_result_t<F, E&&>;
        if (hasValue()) {
            return Expected<T, G>(std::move(*this).value());
        }
        return Expected<T, G>(std::forward<F>(func)(std::move(*this).error()));
    }

    /**
     * @brief 链式操作
     */
    template<typename F>
    auto andThen(F&& func) && -> std::invoke_result_t<F, T&&> {
        using R = std::invoke_result_t<F, T&&>;
        if (hasValue()) {
            return std::forward<F>(func)(std::move(*this).value());
        }
        return R(std::move(*this).error());
    }

    /**
     * @brief 抛出异常（如果是错误）
     */
    T valueOrThrow() && {
        if (hasError()) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error());
            } else {
                throw error();
            }
        }
        return std::move(*this).value();
    }
};

/**
 * @brief 特化：void类型的Expected
 */
template<typename E>
class Expected<void, E> {
private:
    E error_;
    bool has_value_;

public:
    using value_type = void;
    using error_type = E;

    Expected() : has_value_(true) {}

    Expected(const E& error) : error_(error), has_value_(false) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(false) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    void valueOrThrow() const {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw error_;
            }
        }
    }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

} // namespace core
} // namespace formsave
