#pragma once

#include <libtabdock/Platform/ILogSink.h>
#include <libtabdock/Platform/LogLevel.h>

#include <cstdarg>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tabdock
{
    // a named logger that formats printf-style messages and forwards them
    // to each of its sinks
    //
    // heavily inspired by `spdlog`
    class Logger final {
    public:
        explicit Logger(std::string_view name) :
            name_{name}
        {}

        Logger(std::string_view name, std::shared_ptr<ILogSink> sink) :
            name_{name},
            sinks_{std::move(sink)}
        {}

        const std::string& name() const { return name_; }

        LogLevel level() const { return level_; }
        void set_level(LogLevel level) { level_ = level; }

        const std::vector<std::shared_ptr<ILogSink>>& sinks() const { return sinks_; }
        std::vector<std::shared_ptr<ILogSink>>& sinks() { return sinks_; }

        void log_message(LogLevel, const char* fmt, ...);
        void log_message_v(LogLevel, const char* fmt, va_list);

    private:
        std::string name_;
        std::vector<std::shared_ptr<ILogSink>> sinks_;
        LogLevel level_ = LogLevel::trace;
    };
}
