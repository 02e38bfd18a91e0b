#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace chat_backup::common::types {

using Timestamp = std::chrono::system_clock::time_point;
using MillisecondsSince1970 = uint64_t;
using Duration = std::chrono::milliseconds;

// 当前时间提供者，测试中可替换
using DateProvider = std::function<Timestamp()>;

inline MillisecondsSince1970 ToMillisecondsSince1970(Timestamp timestamp) {
    return static_cast<MillisecondsSince1970>(
        std::chrono::duration_cast<Duration>(timestamp.time_since_epoch()).count());
}

inline Timestamp FromMillisecondsSince1970(MillisecondsSince1970 millis) {
    return Timestamp(Duration(static_cast<Duration::rep>(millis)));
}

} // namespace chat_backup::common::types
