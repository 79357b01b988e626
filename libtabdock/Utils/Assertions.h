#pragma once

namespace tabdock
{
    // logs the failing expression and terminates the process
    [[noreturn]] void on_assertion_failure(
        const char* failing_code,
        const char* func,
        const char* file,
        unsigned int line
    ) noexcept;
}

// always executed, even in release builds
#define TABDOCK_ASSERT_ALWAYS(expr) \
    (static_cast<bool>(expr) ? (void)0 : tabdock::on_assertion_failure(#expr, __func__, __FILE__, __LINE__))

#if defined(TABDOCK_FORCE_ASSERTS_ENABLED) || !defined(NDEBUG)
#define TABDOCK_ASSERT(expr) TABDOCK_ASSERT_ALWAYS(expr)
#else
#define TABDOCK_ASSERT(expr)
#endif
