#include <powgiver/logging/fmt_logger.hpp>

#include <cstdio>

#include <fmt/core.h>

#include <powgiver/log.hpp>

namespace powgiver::logging {

void FmtLogger::write(std::FILE* out, std::string_view level, std::string_view msg) const {
    if (timestamps_) {
        fmt::print(out, "{} [{}] {}\n", powgiver::log::now_hms(), level, msg);
    } else {
        fmt::print(out, "[{}] {}\n", level, msg);
    }
}

void FmtLogger::info(std::string_view msg) { write(stdout, "INFO", msg); }
void FmtLogger::warn(std::string_view msg) { write(stdout, "WARN", msg); }
void FmtLogger::error(std::string_view msg) { write(stderr, "ERROR", msg); }
void FmtLogger::debug(std::string_view msg) {
    if (enable_debug_.load()) write(stdout, "DEBUG", msg);
}

} // namespace powgiver::logging
