/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <fmt/format.h>
#include <string_view>
#include <utility>

namespace powgiver {
namespace log {

inline std::string now_hms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return fmt::format("[{:02d}:{:02d}:{:02d}]", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

// Unix seconds, as used for job expiry
inline uint32_t now_unix() {
    using namespace std::chrono;
    return static_cast<uint32_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

// Untagged result line on stdout: "<label padded to 12> : <value>"
template <typename... Args>
inline void field(std::string_view label, std::string_view fmtstr, Args&&... args) {
    fmt::print("  {:<12}: ", label);
    fmt::print(fmt::runtime(fmtstr), std::forward<Args>(args)...);
    fmt::print("\n");
}

} // namespace log
} // namespace powgiver
