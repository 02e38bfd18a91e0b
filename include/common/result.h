#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace chat_backup::common {

// 通用结果类，用于表示操作的成功或失败
template <typename T, typename E = std::string>
class Result {
public:
    // 创建成功结果
    static Result<T, E> Ok(T value) {
        return Result<T, E>(std::in_place_index<0>, std::move(value));
    }

    // 创建失败结果
    static Result<T, E> Error(E error) {
        return Result<T, E>(std::in_place_index<1>, std::move(error));
    }

    // 检查结果是否成功
    bool IsOk() const {
        return result_.index() == 0;
    }

    // 检查结果是否失败
    bool IsError() const {
        return result_.index() == 1;
    }

    // 获取结果值（如果成功）
    const T& GetValue() const {
        if (IsError()) {
            throw std::runtime_error("Cannot get value from error result");
        }
        return std::get<0>(result_);
    }

    // 获取可修改的结果值
    T& GetValue() {
        if (IsError()) {
            throw std::runtime_error("Cannot get value from error result");
        }
        return std::get<0>(result_);
    }

    // 获取错误（如果失败）
    const E& GetError() const {
        if (IsOk()) {
            throw std::runtime_error("Cannot get error from successful result");
        }
        return std::get<1>(result_);
    }

    // 映射结果到另一个类型
    template <typename U, typename Func>
    Result<U, E> Map(Func&& func) const {
        if (IsOk()) {
            return Result<U, E>::Ok(func(GetValue()));
        } else {
            return Result<U, E>::Error(GetError());
        }
    }

    // 执行错误处理
    template <typename Func>
    Result<T, E>& Catch(Func&& func) {
        if (IsError()) {
            func(GetError());
        }
        return *this;
    }

    // 提供默认值
    T ValueOr(T default_value) const {
        if (IsOk()) {
            return GetValue();
        }
        return default_value;
    }

private:
    // 存储成功值或错误，按下标区分以支持 T 与 E 相同的情况
    std::variant<T, E> result_;

    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& value)
        : result_(index, std::forward<V>(value)) {}
};

// Result<void>的特化版本
template <typename E>
class Result<void, E> {
public:
    static Result<void, E> Ok() {
        return Result<void, E>();
    }

    static Result<void, E> Error(E error) {
        return Result<void, E>(std::move(error));
    }

    bool IsOk() const {
        return !error_.has_value();
    }

    bool IsError() const {
        return error_.has_value();
    }

    const E& GetError() const {
        if (IsOk()) {
            throw std::runtime_error("Cannot get error from successful result");
        }
        return *error_;
    }

    template <typename Func>
    Result<void, E>& Catch(Func&& func) {
        if (IsError()) {
            func(*error_);
        }
        return *this;
    }

private:
    std::optional<E> error_;

    Result() = default;
    explicit Result(E error) : error_(std::move(error)) {}
};

} // namespace chat_backup::common
