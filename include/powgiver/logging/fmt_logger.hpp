#pragma once

#include <powgiver/logging/logger.hpp>

#include <atomic>
#include <cstdio>

namespace powgiver::logging {

// Writes "[hh:mm:ss] [LEVEL] msg". Errors go to stderr, debug only when enabled.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false, bool timestamps = true)
        : enable_debug_(enable_debug), timestamps_(timestamps) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    bool debug_enabled() const { return enable_debug_.load(); }

private:
    void write(std::FILE* out, std::string_view level, std::string_view msg) const;

    std::atomic<bool> enable_debug_{false};
    bool timestamps_{true};
};

} // namespace powgiver::logging
