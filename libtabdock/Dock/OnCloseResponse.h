#pragma once

#include <libtabdock/Utils/CStringView.h>

#include <iosfwd>

namespace tabdock
{
    // what a `TabViewer` wants the host to do when the user asks to close a tab
    enum class OnCloseResponse {
        Close,   // remove the tab
        Focus,   // keep the tab, and make it the active + focused tab
        Ignore,  // keep the tab, change nothing
        NUM_OPTIONS,
    };

    CStringView to_cstringview(OnCloseResponse);
    std::ostream& operator<<(std::ostream&, OnCloseResponse);
}
