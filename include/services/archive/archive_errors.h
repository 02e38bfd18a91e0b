#pragma once

#include <string>
#include <variant>
#include <vector>

#include "models/identifiers.h"
#include "models/interaction.h"
#include "models/thread.h"

namespace chat_backup::services::archive {

// 单条记录的归档错误，记录后继续处理下一条
struct ArchiveFrameError {
    enum class Type {
        kReferencedIdMissing,
        kFrameWriteFailed,
        kMessageContentMissing,
        kUnsupportedInteraction,
        kRevisionLookupFailed,
        kReactionLookupFailed
    };

    std::string object_id;
    Type type;
    // 缺失的引用标识符或底层错误描述
    std::string detail;

    int Code() const;
    std::string ToString() const;

    static ArchiveFrameError ReferencedIdMissing(const models::ChatItemId& object_id,
                                                 const models::ThreadUniqueId& thread_id);
    static ArchiveFrameError ReferencedRecipientMissing(const std::string& object_id,
                                                        const std::string& address);
    static ArchiveFrameError FrameWriteFailed(const std::string& object_id, const std::string& detail);
    static ArchiveFrameError MessageContentMissing(const models::ChatItemId& object_id);
    static ArchiveFrameError UnsupportedInteraction(const models::ChatItemId& object_id,
                                                    const std::string& kind);
    static ArchiveFrameError RevisionLookupFailed(const models::ChatItemId& object_id,
                                                  const std::string& detail);
    static ArchiveFrameError ReactionLookupFailed(const models::ChatItemId& object_id,
                                                  const std::string& detail);
};

// 终止整个归档过程的致命错误
struct FatalArchiveError {
    std::string message;
};

// 批量归档的结果：成功、部分成功或完全失败
class ArchiveMultiFrameResult {
public:
    static ArchiveMultiFrameResult Success();
    static ArchiveMultiFrameResult PartialSuccess(std::vector<ArchiveFrameError> errors);
    static ArchiveMultiFrameResult CompleteFailure(FatalArchiveError error);

    bool IsSuccess() const;
    bool IsPartialSuccess() const;
    bool IsCompleteFailure() const;

    // 仅部分成功时有效
    const std::vector<ArchiveFrameError>& GetErrors() const;

    // 仅完全失败时有效
    const FatalArchiveError& GetFatalError() const;

private:
    using State = std::variant<std::monostate, std::vector<ArchiveFrameError>, FatalArchiveError>;

    explicit ArchiveMultiFrameResult(State state) : state_(std::move(state)) {}

    State state_;
};

struct RestoreFrameError {
    enum class Type {
        kIdentifierNotFound,
        kReferencedDatabaseObjectNotFound,
        kDatabaseInsertionFailed,
        kInvalidFrameData,
        kUnsupportedChatItem
    };

    Type type;
    std::string detail;

    int Code() const;
    std::string ToString() const;

    static RestoreFrameError IdentifierNotFound(const models::ChatId& chat_id);
    static RestoreFrameError IdentifierNotFound(const models::RecipientId& recipient_id);
    static RestoreFrameError ReferencedDatabaseObjectNotFound(const models::ThreadUniqueId& thread_id);
    static RestoreFrameError DatabaseInsertionFailed(const std::string& detail);
    static RestoreFrameError InvalidFrameData(const std::string& detail);
    static RestoreFrameError UnsupportedChatItem();
};

// 单条记录的恢复结果，失败只影响该记录
class RestoreFrameResult {
public:
    enum class Status {
        kSuccess,
        kPartialRestore,
        kFailure
    };

    // 部分恢复时已写入的本地记录：会话或消息
    using RestoredRecord = std::variant<std::monostate, models::Thread, models::Interaction>;

    static RestoreFrameResult Success();
    static RestoreFrameResult PartialRestore(std::string object_id,
                                             std::vector<RestoreFrameError> errors,
                                             RestoredRecord restored = {});
    static RestoreFrameResult Failure(std::string object_id, std::vector<RestoreFrameError> errors);

    Status GetStatus() const { return status_; }
    bool IsSuccess() const { return status_ == Status::kSuccess; }
    bool IsPartialRestore() const { return status_ == Status::kPartialRestore; }
    bool IsFailure() const { return status_ == Status::kFailure; }

    const std::string& GetObjectId() const { return object_id_; }
    const std::vector<RestoreFrameError>& GetErrors() const { return errors_; }
    const RestoredRecord& GetRestoredRecord() const { return restored_; }

private:
    RestoreFrameResult(Status status, std::string object_id, std::vector<RestoreFrameError> errors,
                       RestoredRecord restored = {})
        : status_(status), object_id_(std::move(object_id)), errors_(std::move(errors)),
          restored_(std::move(restored)) {}

    Status status_;
    std::string object_id_;
    std::vector<RestoreFrameError> errors_;
    RestoredRecord restored_;
};

} // namespace chat_backup::services::archive
