#include "models/thread.h"

namespace chat_backup::models {

std::string ToString(ThreadKind kind) {
    return kind == ThreadKind::kGroup ? "group" : "contact";
}

ThreadKind ThreadKindFromString(const std::string& value) {
    return value == "group" ? ThreadKind::kGroup : ThreadKind::kContact;
}

} // namespace chat_backup::models
