#include "Logger.h"

#include <libtabdock/Platform/LogMessageView.h>

#include <algorithm>
#include <array>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <string_view>

void tabdock::Logger::log_message(LogLevel level, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    log_message_v(level, fmt, args);
    va_end(args);
}

void tabdock::Logger::log_message_v(LogLevel level, const char* fmt, va_list args)
{
    if (level < level_ or level >= LogLevel::off) {
        return;
    }

    thread_local std::array<char, 2048> buffer{};
    const int rv = std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    if (rv < 0) {
        return;
    }
    const size_t n = std::min(static_cast<size_t>(rv), buffer.size() - 1);

    const LogMessageView message{name_, std::string_view{buffer.data(), n}, level};
    for (const auto& sink : sinks_) {
        if (sink->should_log(level)) {
            sink->log_message(message);
        }
    }
}
