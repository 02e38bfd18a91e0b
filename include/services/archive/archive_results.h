#pragma once

#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "services/archive/archive_errors.h"

namespace chat_backup::services::archive {

// 单个归档器处理一条消息的结果
template <typename T>
class ArchiveInteractionResult {
public:
    enum class Status {
        kSuccess,
        kIsPastRevision,
        kNotYetImplemented,
        kMessageFailure,
        kPartialFailure,
        kCompleteFailure
    };

    static ArchiveInteractionResult Success(T value) {
        ArchiveInteractionResult result(Status::kSuccess);
        result.value_ = std::move(value);
        return result;
    }

    // 已被最新版本收录的历史版本，跳过
    static ArchiveInteractionResult IsPastRevision() {
        return ArchiveInteractionResult(Status::kIsPastRevision);
    }

    static ArchiveInteractionResult NotYetImplemented() {
        return ArchiveInteractionResult(Status::kNotYetImplemented);
    }

    static ArchiveInteractionResult MessageFailure(std::vector<ArchiveFrameError> errors) {
        ArchiveInteractionResult result(Status::kMessageFailure);
        result.errors_ = std::move(errors);
        return result;
    }

    static ArchiveInteractionResult PartialFailure(T value, std::vector<ArchiveFrameError> errors) {
        ArchiveInteractionResult result(Status::kPartialFailure);
        result.value_ = std::move(value);
        result.errors_ = std::move(errors);
        return result;
    }

    static ArchiveInteractionResult CompleteFailure(FatalArchiveError error) {
        ArchiveInteractionResult result(Status::kCompleteFailure);
        result.fatal_error_ = std::move(error);
        return result;
    }

    // 成功时带上已累积的部分错误，没有错误则为普通成功
    static ArchiveInteractionResult SuccessOrPartial(T value, std::vector<ArchiveFrameError> errors) {
        if (errors.empty()) {
            return Success(std::move(value));
        }
        return PartialFailure(std::move(value), std::move(errors));
    }

    Status GetStatus() const { return status_; }

    bool HasValue() const { return value_.has_value(); }

    const T& GetValue() const {
        if (!value_) {
            throw std::runtime_error("Archive result carries no value");
        }
        return *value_;
    }

    T& GetValue() {
        if (!value_) {
            throw std::runtime_error("Archive result carries no value");
        }
        return *value_;
    }

    const std::vector<ArchiveFrameError>& GetErrors() const { return errors_; }

    const FatalArchiveError& GetFatalError() const {
        if (!fatal_error_) {
            throw std::runtime_error("Archive result carries no fatal error");
        }
        return *fatal_error_;
    }

    // 将不带值的结果转换为另一种值类型，用于向上层传递失败
    template <typename U>
    ArchiveInteractionResult<U> Forward() const {
        switch (status_) {
            case Status::kIsPastRevision:
                return ArchiveInteractionResult<U>::IsPastRevision();
            case Status::kNotYetImplemented:
                return ArchiveInteractionResult<U>::NotYetImplemented();
            case Status::kMessageFailure:
                return ArchiveInteractionResult<U>::MessageFailure(errors_);
            case Status::kCompleteFailure:
                return ArchiveInteractionResult<U>::CompleteFailure(*fatal_error_);
            case Status::kSuccess:
            case Status::kPartialFailure:
                break;
        }
        throw std::logic_error("Cannot forward an archive result that carries a value");
    }

private:
    explicit ArchiveInteractionResult(Status status) : status_(status) {}

    Status status_;
    std::optional<T> value_;
    std::vector<ArchiveFrameError> errors_;
    std::optional<FatalArchiveError> fatal_error_;
};

// 单个归档器恢复一条记录的结果
template <typename T>
class RestoreInteractionResult {
public:
    enum class Status {
        kSuccess,
        kPartialRestore,
        kMessageFailure
    };

    static RestoreInteractionResult Success(T value) {
        RestoreInteractionResult result(Status::kSuccess);
        result.value_ = std::move(value);
        return result;
    }

    static RestoreInteractionResult PartialRestore(T value, std::vector<RestoreFrameError> errors) {
        RestoreInteractionResult result(Status::kPartialRestore);
        result.value_ = std::move(value);
        result.errors_ = std::move(errors);
        return result;
    }

    static RestoreInteractionResult MessageFailure(std::vector<RestoreFrameError> errors) {
        RestoreInteractionResult result(Status::kMessageFailure);
        result.errors_ = std::move(errors);
        return result;
    }

    static RestoreInteractionResult SuccessOrPartial(T value, std::vector<RestoreFrameError> errors) {
        if (errors.empty()) {
            return Success(std::move(value));
        }
        return PartialRestore(std::move(value), std::move(errors));
    }

    Status GetStatus() const { return status_; }

    const T& GetValue() const {
        if (!value_) {
            throw std::runtime_error("Restore result carries no value");
        }
        return *value_;
    }

    const std::vector<RestoreFrameError>& GetErrors() const { return errors_; }

private:
    explicit RestoreInteractionResult(Status status) : status_(status) {}

    Status status_;
    std::optional<T> value_;
    std::vector<RestoreFrameError> errors_;
};

} // namespace chat_backup::services::archive
