#include "common/error_codes.h"

namespace chat_backup::common::error_codes {

// 归档错误（1xxx）
const ErrorCode REFERENCED_ID_MISSING                = {1001, "引用的标识符不存在"};
const ErrorCode FRAME_WRITE_FAILED                   = {1002, "写入备份帧失败"};
const ErrorCode MESSAGE_CONTENT_MISSING              = {1003, "消息内容为空"};
const ErrorCode UNSUPPORTED_INTERACTION              = {1004, "不支持的消息类型"};
const ErrorCode REVISION_LOOKUP_FAILED               = {1005, "读取编辑历史失败"};
const ErrorCode REACTION_LOOKUP_FAILED               = {1006, "读取表情回应失败"};

// 恢复错误（2xxx）
const ErrorCode IDENTIFIER_NOT_FOUND                 = {2001, "备份标识符未找到"};
const ErrorCode REFERENCED_DATABASE_OBJECT_NOT_FOUND = {2002, "引用的数据库对象不存在"};
const ErrorCode DATABASE_INSERTION_FAILED            = {2003, "写入数据库失败"};
const ErrorCode INVALID_FRAME_DATA                   = {2004, "备份帧数据无效"};
const ErrorCode UNSUPPORTED_CHAT_ITEM                = {2005, "不支持的聊天记录类型"};

std::string GetErrorMessage(int code) {
    // 归档错误
    if (code == REFERENCED_ID_MISSING.code) return REFERENCED_ID_MISSING.message;
    if (code == FRAME_WRITE_FAILED.code) return FRAME_WRITE_FAILED.message;
    if (code == MESSAGE_CONTENT_MISSING.code) return MESSAGE_CONTENT_MISSING.message;
    if (code == UNSUPPORTED_INTERACTION.code) return UNSUPPORTED_INTERACTION.message;
    if (code == REVISION_LOOKUP_FAILED.code) return REVISION_LOOKUP_FAILED.message;
    if (code == REACTION_LOOKUP_FAILED.code) return REACTION_LOOKUP_FAILED.message;

    // 恢复错误
    if (code == IDENTIFIER_NOT_FOUND.code) return IDENTIFIER_NOT_FOUND.message;
    if (code == REFERENCED_DATABASE_OBJECT_NOT_FOUND.code) return REFERENCED_DATABASE_OBJECT_NOT_FOUND.message;
    if (code == DATABASE_INSERTION_FAILED.code) return DATABASE_INSERTION_FAILED.message;
    if (code == INVALID_FRAME_DATA.code) return INVALID_FRAME_DATA.message;
    if (code == UNSUPPORTED_CHAT_ITEM.code) return UNSUPPORTED_CHAT_ITEM.message;

    // 未知错误
    return "未知错误";
}

} // namespace chat_backup::common::error_codes
