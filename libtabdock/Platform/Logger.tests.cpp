#include "Logger.h"

#include <libtabdock/Platform/Log.h>
#include <libtabdock/Platform/LogMessage.h>
#include <libtabdock/Platform/LogSink.h>

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace tabdock;

namespace
{
    class CapturingSink final : public LogSink {
    public:
        const std::vector<LogMessage>& messages() const { return messages_; }
    private:
        void impl_log_message(const LogMessageView& message) final
        {
            messages_.emplace_back(message);
        }

        std::vector<LogMessage> messages_;
    };
}

TEST(Logger, formats_printf_style_messages_into_its_sinks)
{
    auto sink = std::make_shared<CapturingSink>();
    Logger logger{"test", sink};

    logger.log_message(LogLevel::info, "closed tab '%s' (%zu remaining)", "Settings", static_cast<size_t>(3));

    ASSERT_EQ(sink->messages().size(), 1);
    ASSERT_EQ(sink->messages().front().payload(), "closed tab 'Settings' (3 remaining)");
    ASSERT_EQ(sink->messages().front().logger_name(), "test");
    ASSERT_EQ(sink->messages().front().level(), LogLevel::info);
}

TEST(Logger, drops_messages_below_the_logger_level)
{
    auto sink = std::make_shared<CapturingSink>();
    Logger logger{"test", sink};
    logger.set_level(LogLevel::warn);

    logger.log_message(LogLevel::debug, "dropped");
    logger.log_message(LogLevel::err, "kept");

    ASSERT_EQ(sink->messages().size(), 1);
    ASSERT_EQ(sink->messages().front().payload(), "kept");
}

TEST(Logger, drops_messages_below_a_sink_level)
{
    auto quiet = std::make_shared<CapturingSink>();
    quiet->set_level(LogLevel::err);
    auto loud = std::make_shared<CapturingSink>();

    Logger logger{"test"};
    logger.sinks().push_back(quiet);
    logger.sinks().push_back(loud);

    logger.log_message(LogLevel::info, "hello");

    ASSERT_TRUE(quiet->messages().empty());
    ASSERT_EQ(loud->messages().size(), 1);
}

TEST(Logger, truncates_messages_longer_than_its_buffer)
{
    auto sink = std::make_shared<CapturingSink>();
    Logger logger{"test", sink};

    const std::string huge(4096, 'x');
    logger.log_message(LogLevel::info, "%s", huge.c_str());

    ASSERT_EQ(sink->messages().size(), 1);
    ASSERT_LT(sink->messages().front().payload().size(), huge.size());
}

TEST(Log, global_logger_forwards_to_attached_sinks)
{
    auto sink = std::make_shared<CapturingSink>();
    auto logger = global_default_logger();
    logger->sinks().push_back(sink);

    log_warn("surface %zu has no tabs", static_cast<size_t>(2));

    std::erase(logger->sinks(), sink);

    ASSERT_EQ(sink->messages().size(), 1);
    ASSERT_EQ(sink->messages().front().payload(), "surface 2 has no tabs");
    ASSERT_EQ(sink->messages().front().level(), LogLevel::warn);
}

TEST(LogLevel, prints_human_readable_names)
{
    std::stringstream ss;
    ss << LogLevel::warn << ' ' << LogLevel::err;
    ASSERT_EQ(ss.str(), "warning error");
}
