#pragma once

#include <string>

namespace chat_backup::common::error_codes {

struct ErrorCode {
    int code;
    std::string message;
};

// 归档错误（1xxx）
extern const ErrorCode REFERENCED_ID_MISSING;
extern const ErrorCode FRAME_WRITE_FAILED;
extern const ErrorCode MESSAGE_CONTENT_MISSING;
extern const ErrorCode UNSUPPORTED_INTERACTION;
extern const ErrorCode REVISION_LOOKUP_FAILED;
extern const ErrorCode REACTION_LOOKUP_FAILED;

// 恢复错误（2xxx）
extern const ErrorCode IDENTIFIER_NOT_FOUND;
extern const ErrorCode REFERENCED_DATABASE_OBJECT_NOT_FOUND;
extern const ErrorCode DATABASE_INSERTION_FAILED;
extern const ErrorCode INVALID_FRAME_DATA;
extern const ErrorCode UNSUPPORTED_CHAT_ITEM;

std::string GetErrorMessage(int code);

} // namespace chat_backup::common::error_codes
