#include "Log.h"

#include <libtabdock/Platform/LogMessageView.h>
#include <libtabdock/Platform/LogSink.h>

#include <iostream>
#include <memory>
#include <mutex>

using namespace tabdock;

namespace
{
    class StderrSink final : public LogSink {
    private:
        void impl_log_message(const LogMessageView& message) final
        {
            const std::lock_guard lock{mutex_};
            std::cerr << '[' << message.logger_name() << "] [" << message.level() << "] " << message.payload() << std::endl;
        }

        std::mutex mutex_;
    };

    std::shared_ptr<Logger> create_global_default_logger()
    {
        auto rv = std::make_shared<Logger>("tabdock", std::make_shared<StderrSink>());
        rv->set_level(LogLevel::info);
        return rv;
    }

    const std::shared_ptr<Logger>& get_global_default_logger()
    {
        static const std::shared_ptr<Logger> s_logger = create_global_default_logger();
        return s_logger;
    }
}

std::shared_ptr<Logger> tabdock::global_default_logger()
{
    return get_global_default_logger();
}

Logger* tabdock::global_default_logger_raw()
{
    return get_global_default_logger().get();
}

LogLevel tabdock::log_level()
{
    return global_default_logger_raw()->level();
}

void tabdock::set_log_level(LogLevel level)
{
    global_default_logger_raw()->set_level(level);
}
