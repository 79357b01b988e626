#pragma once

namespace tabdock
{
    // which scroll bars the host provisions around a tab's body
    struct ScrollBars final {
        friend constexpr bool operator==(const ScrollBars&, const ScrollBars&) = default;

        bool horizontal = true;
        bool vertical = true;
    };
}
