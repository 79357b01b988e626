#pragma once

#include <libtabdock/Platform/LogLevel.h>
#include <libtabdock/Platform/LogMessageView.h>

namespace tabdock
{
    class ILogSink {
    protected:
        ILogSink() = default;
        ILogSink(const ILogSink&) = default;
        ILogSink(ILogSink&&) noexcept = default;
        ILogSink& operator=(const ILogSink&) = default;
        ILogSink& operator=(ILogSink&&) noexcept = default;
    public:
        virtual ~ILogSink() noexcept = default;

        void log_message(const LogMessageView& message) { impl_log_message(message); }
        LogLevel level() const { return impl_level(); }
        void set_level(LogLevel level) { impl_set_level(level); }
        bool should_log(LogLevel level) const { return level >= impl_level(); }

    private:
        virtual void impl_log_message(const LogMessageView&) = 0;
        virtual LogLevel impl_level() const = 0;
        virtual void impl_set_level(LogLevel) = 0;
    };
}
