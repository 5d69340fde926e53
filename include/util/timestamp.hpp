#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace sk::util {

// ISO 8601 basic format used by SigV4, e.g. 20250626T152935Z
inline std::string getCurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

} // namespace sk::util
