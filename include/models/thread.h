#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chat_backup::models {

enum class ThreadKind {
    kContact,
    kGroup
};

struct Reaction {
    std::string unique_message_id;
    std::string reactor_address;
    std::string emoji;
    uint64_t sent_at = 0;
    uint64_t received_at = 0;
};

struct Thread {
    std::string unique_id;
    ThreadKind kind = ThreadKind::kContact;
    std::vector<std::string> participant_addresses;
    std::string group_id;
    std::string name;
};

std::string ToString(ThreadKind kind);
ThreadKind ThreadKindFromString(const std::string& value);

} // namespace chat_backup::models
