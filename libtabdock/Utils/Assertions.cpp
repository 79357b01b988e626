#include "Assertions.h"

#include <libtabdock/Platform/Log.h>

#include <exception>

void tabdock::on_assertion_failure(
    const char* failing_code,
    const char* func,
    const char* file,
    unsigned int line) noexcept
{
    log_critical("%s:%s:%u: assert(%s): failed", file, func, line, failing_code);
    std::terminate();
}
