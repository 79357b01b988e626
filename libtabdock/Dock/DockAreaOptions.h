#pragma once

namespace tabdock
{
    // user-facing toggles that change how a `DockArea` behaves
    struct DockAreaOptions final {
        friend bool operator==(const DockAreaOptions&, const DockAreaOptions&) = default;

        bool show_close_buttons = true;
        bool show_add_buttons = false;
        bool show_add_popup = false;
        bool tab_context_menus = true;
        bool show_tab_name_on_hover = false;
        bool show_window_close_buttons = true;
        bool show_window_collapse_buttons = true;
    };
}
