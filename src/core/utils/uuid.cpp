#include "core/utils/uuid.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

namespace chat_backup::core::utils {

namespace {

std::mt19937_64& Engine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // namespace

std::string UuidGenerator::GenerateUuid() {
    uint64_t high = Engine()();
    uint64_t low = Engine()();

    // 版本4与RFC 4122变体位
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (high >> 32) << "-";
    oss << std::setw(4) << ((high >> 16) & 0xFFFF) << "-";
    oss << std::setw(4) << (high & 0xFFFF) << "-";
    oss << std::setw(4) << (low >> 48) << "-";
    oss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

bool UuidGenerator::IsValid(const std::string& uuid) {
    static const std::regex uuid_regex(
        "^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$",
        std::regex_constants::icase
    );

    return std::regex_match(uuid, uuid_regex);
}

} // namespace chat_backup::core::utils
