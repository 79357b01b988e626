#include "TabBodyFlags.h"

#include <libtabdock/Dock/ScrollBars.h>
#include <libtabdock/UI/tabdockimgui.h>

tabdock::TabBodyFlags tabdock::to_body_panel_flags(const ScrollBars& scroll_bars)
{
    // the host fills the body itself (see `TabViewer::clear_background`)
    TabBodyFlags rv{.panel_flags = ui::PanelFlag::NoBackground, .child_panel_flags = {}};

    if (scroll_bars.horizontal) {
        rv.panel_flags |= ui::PanelFlag::HorizontalScrollbar;
    }

    if (not scroll_bars.vertical) {
        if (scroll_bars.horizontal) {
            // grow to fit the content, so that there's never anything to scroll vertically
            rv.child_panel_flags |= ui::ChildPanelFlag::AutoResizeY;
        }
        else {
            rv.panel_flags |= ui::PanelFlag::NoScrollbar;
            rv.panel_flags |= ui::PanelFlag::NoScrollWithMouse;
        }
    }
    return rv;
}
