#include "services/archive/archive_errors.h"

#include <stdexcept>

#include "common/error_codes.h"

namespace chat_backup::services::archive {

namespace codes = common::error_codes;

int ArchiveFrameError::Code() const {
    switch (type) {
        case Type::kReferencedIdMissing: return codes::REFERENCED_ID_MISSING.code;
        case Type::kFrameWriteFailed: return codes::FRAME_WRITE_FAILED.code;
        case Type::kMessageContentMissing: return codes::MESSAGE_CONTENT_MISSING.code;
        case Type::kUnsupportedInteraction: return codes::UNSUPPORTED_INTERACTION.code;
        case Type::kRevisionLookupFailed: return codes::REVISION_LOOKUP_FAILED.code;
        case Type::kReactionLookupFailed: return codes::REACTION_LOOKUP_FAILED.code;
    }
    return 0;
}

std::string ArchiveFrameError::ToString() const {
    std::string text = "[" + std::to_string(Code()) + "] " + codes::GetErrorMessage(Code()) +
                       " (" + object_id + ")";
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

ArchiveFrameError ArchiveFrameError::ReferencedIdMissing(const models::ChatItemId& object_id,
                                                         const models::ThreadUniqueId& thread_id) {
    return {object_id.ToString(), Type::kReferencedIdMissing, thread_id.ToString()};
}

ArchiveFrameError ArchiveFrameError::ReferencedRecipientMissing(const std::string& object_id,
                                                                const std::string& address) {
    return {object_id, Type::kReferencedIdMissing, "recipient:" + address};
}

ArchiveFrameError ArchiveFrameError::FrameWriteFailed(const std::string& object_id,
                                                      const std::string& detail) {
    return {object_id, Type::kFrameWriteFailed, detail};
}

ArchiveFrameError ArchiveFrameError::MessageContentMissing(const models::ChatItemId& object_id) {
    return {object_id.ToString(), Type::kMessageContentMissing, ""};
}

ArchiveFrameError ArchiveFrameError::UnsupportedInteraction(const models::ChatItemId& object_id,
                                                            const std::string& kind) {
    return {object_id.ToString(), Type::kUnsupportedInteraction, kind};
}

ArchiveFrameError ArchiveFrameError::RevisionLookupFailed(const models::ChatItemId& object_id,
                                                          const std::string& detail) {
    return {object_id.ToString(), Type::kRevisionLookupFailed, detail};
}

ArchiveFrameError ArchiveFrameError::ReactionLookupFailed(const models::ChatItemId& object_id,
                                                          const std::string& detail) {
    return {object_id.ToString(), Type::kReactionLookupFailed, detail};
}

ArchiveMultiFrameResult ArchiveMultiFrameResult::Success() {
    return ArchiveMultiFrameResult(std::monostate{});
}

ArchiveMultiFrameResult ArchiveMultiFrameResult::PartialSuccess(std::vector<ArchiveFrameError> errors) {
    return ArchiveMultiFrameResult(std::move(errors));
}

ArchiveMultiFrameResult ArchiveMultiFrameResult::CompleteFailure(FatalArchiveError error) {
    return ArchiveMultiFrameResult(std::move(error));
}

bool ArchiveMultiFrameResult::IsSuccess() const {
    return std::holds_alternative<std::monostate>(state_);
}

bool ArchiveMultiFrameResult::IsPartialSuccess() const {
    return std::holds_alternative<std::vector<ArchiveFrameError>>(state_);
}

bool ArchiveMultiFrameResult::IsCompleteFailure() const {
    return std::holds_alternative<FatalArchiveError>(state_);
}

const std::vector<ArchiveFrameError>& ArchiveMultiFrameResult::GetErrors() const {
    if (!IsPartialSuccess()) {
        throw std::runtime_error("Cannot get partial errors from a result that is not partial success");
    }
    return std::get<std::vector<ArchiveFrameError>>(state_);
}

const FatalArchiveError& ArchiveMultiFrameResult::GetFatalError() const {
    if (!IsCompleteFailure()) {
        throw std::runtime_error("Cannot get fatal error from a result that is not complete failure");
    }
    return std::get<FatalArchiveError>(state_);
}

int RestoreFrameError::Code() const {
    switch (type) {
        case Type::kIdentifierNotFound: return codes::IDENTIFIER_NOT_FOUND.code;
        case Type::kReferencedDatabaseObjectNotFound: return codes::REFERENCED_DATABASE_OBJECT_NOT_FOUND.code;
        case Type::kDatabaseInsertionFailed: return codes::DATABASE_INSERTION_FAILED.code;
        case Type::kInvalidFrameData: return codes::INVALID_FRAME_DATA.code;
        case Type::kUnsupportedChatItem: return codes::UNSUPPORTED_CHAT_ITEM.code;
    }
    return 0;
}

std::string RestoreFrameError::ToString() const {
    std::string text = "[" + std::to_string(Code()) + "] " + codes::GetErrorMessage(Code());
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

RestoreFrameError RestoreFrameError::IdentifierNotFound(const models::ChatId& chat_id) {
    return {Type::kIdentifierNotFound, chat_id.ToString()};
}

RestoreFrameError RestoreFrameError::IdentifierNotFound(const models::RecipientId& recipient_id) {
    return {Type::kIdentifierNotFound, recipient_id.ToString()};
}

RestoreFrameError RestoreFrameError::ReferencedDatabaseObjectNotFound(const models::ThreadUniqueId& thread_id) {
    return {Type::kReferencedDatabaseObjectNotFound, thread_id.ToString()};
}

RestoreFrameError RestoreFrameError::DatabaseInsertionFailed(const std::string& detail) {
    return {Type::kDatabaseInsertionFailed, detail};
}

RestoreFrameError RestoreFrameError::InvalidFrameData(const std::string& detail) {
    return {Type::kInvalidFrameData, detail};
}

RestoreFrameError RestoreFrameError::UnsupportedChatItem() {
    return {Type::kUnsupportedChatItem, ""};
}

RestoreFrameResult RestoreFrameResult::Success() {
    return RestoreFrameResult(Status::kSuccess, "", {});
}

RestoreFrameResult RestoreFrameResult::PartialRestore(std::string object_id,
                                                      std::vector<RestoreFrameError> errors,
                                                      RestoredRecord restored) {
    return RestoreFrameResult(Status::kPartialRestore, std::move(object_id), std::move(errors),
                              std::move(restored));
}

RestoreFrameResult RestoreFrameResult::Failure(std::string object_id,
                                               std::vector<RestoreFrameError> errors) {
    return RestoreFrameResult(Status::kFailure, std::move(object_id), std::move(errors));
}

} // namespace chat_backup::services::archive
