#pragma once
#include "ErrorCodes.h"
#include <optional>
#include <utility>
#include <stdexcept>
#include <functional>
#include <type_traits>

namespace RC {

// Result<T> - 操作结果：要么成功返回值 T，要么失败返回错误信息
template<typename T>
class Result {
private:
    std::optional<T> value_;
    ErrorInfo error_;

public:
    Result() = default;

    // 创建成功结果
    static Result<T> Success(T val) {
        Result<T> r;
        r.value_ = std::move(val);
        r.error_ = ErrorInfo();
        return r;
    }

    // 创建失败结果
    static Result<T> Failure(ErrorInfo err) {
        Result<T> r;
        r.error_ = std::move(err);
        return r;
    }

    static Result<T> Failure(ErrorCode code, const std::string& message = "") {
        return Failure(MakeError(code, message));
    }

    bool IsSuccess() const { return error_.IsSuccess() && value_.has_value(); }
    bool IsFailure() const { return !IsSuccess(); }

    // 获取成功值（失败时抛出异常 - 调用前先检查 IsSuccess）
    T& Value() {
        if (!value_.has_value()) {
            throw std::runtime_error("Attempting to get value from failed Result: " + error_.ToString());
        }
        return value_.value();
    }

    const T& Value() const {
        if (!value_.has_value()) {
            throw std::runtime_error("Attempting to get value from failed Result: " + error_.ToString());
        }
        return value_.value();
    }

    // 转移成功值的所有权（用于 unique_ptr 等只可移动的类型）
    T TakeValue() {
        if (!value_.has_value()) {
            throw std::runtime_error("Attempting to take value from failed Result: " + error_.ToString());
        }
        T out = std::move(value_.value());
        value_.reset();
        return out;
    }

    const ErrorInfo& Error() const { return error_; }

    T ValueOr(T defaultValue) const {
        return value_.value_or(std::move(defaultValue));
    }

    // 以另一种结果类型转发当前错误
    template<typename U>
    Result<U> ForwardError() const {
        return Result<U>::Failure(error_);
    }

    // 链式操作：如果成功则执行函数 f，否则传递错误
    template<typename F>
    auto Then(F f) -> Result<decltype(f(std::declval<T>()))> {
        using RetType = decltype(f(std::declval<T>()));

        if (IsFailure()) {
            return Result<RetType>::Failure(error_);
        }

        return Result<RetType>::Success(f(value_.value()));
    }

    // 如果失败则执行错误处理函数
    Result<T>& OnError(std::function<void(const ErrorInfo&)> errorHandler) {
        if (IsFailure()) {
            errorHandler(error_);
        }
        return *this;
    }

    explicit operator bool() const { return IsSuccess(); }
};

// Result<void> 特化 - 用于不返回值的操作
template<>
class Result<void> {
private:
    ErrorInfo error_;

public:
    Result() = default;

    static Result<void> Success() {
        return Result<void>();
    }

    static Result<void> Failure(ErrorInfo err) {
        Result<void> r;
        r.error_ = std::move(err);
        return r;
    }

    static Result<void> Failure(ErrorCode code, const std::string& message = "") {
        return Failure(MakeError(code, message));
    }

    bool IsSuccess() const { return error_.IsSuccess(); }
    bool IsFailure() const { return !IsSuccess(); }

    const ErrorInfo& Error() const { return error_; }

    template<typename U>
    Result<U> ForwardError() const {
        return Result<U>::Failure(error_);
    }

    Result<void>& OnError(std::function<void(const ErrorInfo&)> errorHandler) {
        if (IsFailure()) {
            errorHandler(error_);
        }
        return *this;
    }

    explicit operator bool() const { return IsSuccess(); }
};

} // namespace RC
