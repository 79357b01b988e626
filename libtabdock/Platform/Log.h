#pragma once

#include <libtabdock/Platform/Logger.h>
#include <libtabdock/Platform/LogLevel.h>
#include <libtabdock/Utils/CStringView.h>

#include <memory>
#include <utility>

// global logging API
//
// messages are printf-formatted, so pass `std::string`s via `.c_str()`
namespace tabdock
{
    std::shared_ptr<Logger> global_default_logger();
    Logger* global_default_logger_raw();

    template<typename... Args>
    void log_message(LogLevel level, CStringView fmt, Args&&... args)
    {
        global_default_logger_raw()->log_message(level, fmt.c_str(), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void log_trace(CStringView fmt, Args&&... args)
    {
        log_message(LogLevel::trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void log_debug(CStringView fmt, Args&&... args)
    {
        log_message(LogLevel::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void log_info(CStringView fmt, Args&&... args)
    {
        log_message(LogLevel::info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void log_warn(CStringView fmt, Args&&... args)
    {
        log_message(LogLevel::warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void log_error(CStringView fmt, Args&&... args)
    {
        log_message(LogLevel::err, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void log_critical(CStringView fmt, Args&&... args)
    {
        log_message(LogLevel::critical, fmt, std::forward<Args>(args)...);
    }

    LogLevel log_level();
    void set_log_level(LogLevel);
}
