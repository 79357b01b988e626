#pragma once

#include <libtabdock/Dock/ScrollBars.h>
#include <libtabdock/UI/tabdockimgui.h>

namespace tabdock
{
    // flags for the child panel that a tab's body is drawn into
    struct TabBodyFlags final {
        friend bool operator==(const TabBodyFlags&, const TabBodyFlags&) = default;

        ui::PanelFlags panel_flags;
        ui::ChildPanelFlags child_panel_flags;
    };

    // Returns the flags that provision (only) the requested scroll bars around a tab's body.
    TabBodyFlags to_body_panel_flags(const ScrollBars&);
}
