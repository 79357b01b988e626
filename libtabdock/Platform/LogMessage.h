#pragma once

#include <libtabdock/Platform/LogLevel.h>
#include <libtabdock/Platform/LogMessageView.h>

#include <chrono>
#include <string>

namespace tabdock
{
    // a log message that owns its data, for sinks that keep messages around
    class LogMessage final {
    public:
        LogMessage() = default;
        explicit LogMessage(const LogMessageView& view) :
            logger_name_{view.logger_name()},
            time_{view.time()},
            payload_{view.payload()},
            level_{view.level()}
        {}

        const std::string& logger_name() const { return logger_name_; }
        std::chrono::system_clock::time_point time() const { return time_; }
        const std::string& payload() const { return payload_; }
        LogLevel level() const { return level_; }

    private:
        std::string logger_name_;
        std::chrono::system_clock::time_point time_{};
        std::string payload_;
        LogLevel level_ = LogLevel::info;
    };
}
