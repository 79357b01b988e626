#include "LogLevel.h"

#include <libtabdock/Utils/CStringView.h>

#include <array>
#include <cstddef>
#include <ostream>

namespace
{
    constexpr auto c_log_level_strings = std::to_array<tabdock::CStringView>({
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "critical",
        "off",
    });
    static_assert(c_log_level_strings.size() == static_cast<size_t>(tabdock::LogLevel::NUM_OPTIONS));
}

tabdock::CStringView tabdock::to_cstringview(LogLevel level)
{
    const auto i = static_cast<size_t>(level);
    return i < c_log_level_strings.size() ? c_log_level_strings[i] : CStringView{"unknown"};
}

std::ostream& tabdock::operator<<(std::ostream& o, LogLevel level)
{
    return o << to_cstringview(level);
}
