#pragma once

#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace powgiver::logging {

class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
    virtual void debug(std::string_view msg) = 0;

    template <typename... Args>
    void infof(fmt::format_string<Args...> f, Args&&... args) {
        info(fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void errorf(fmt::format_string<Args...> f, Args&&... args) {
        error(fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void debugf(fmt::format_string<Args...> f, Args&&... args) {
        debug(fmt::format(f, std::forward<Args>(args)...));
    }
};

} // namespace powgiver::logging
