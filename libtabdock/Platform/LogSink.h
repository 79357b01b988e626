#pragma once

#include <libtabdock/Platform/ILogSink.h>
#include <libtabdock/Platform/LogLevel.h>

namespace tabdock
{
    // a sink that stores its own level, so implementors only need to
    // write `impl_log_message`
    class LogSink : public ILogSink {
    private:
        LogLevel impl_level() const final { return sink_level_; }
        void impl_set_level(LogLevel level) final { sink_level_ = level; }

        LogLevel sink_level_ = LogLevel::trace;
    };
}
