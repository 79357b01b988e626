#pragma once

#include <libtabdock/Utils/CStringView.h>

#include <cstdint>
#include <iosfwd>

namespace tabdock
{
    enum class LogLevel : int32_t {
        trace = 0,
        debug,
        info,
        warn,
        err,
        critical,
        off,
        NUM_OPTIONS,
    };

    CStringView to_cstringview(LogLevel);
    std::ostream& operator<<(std::ostream&, LogLevel);
}
