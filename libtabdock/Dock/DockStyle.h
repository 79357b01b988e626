#pragma once

#include <libtabdock/Dock/TabStyle.h>
#include <libtabdock/Graphics/Color.h>
#include <libtabdock/Maths/Vec2.h>

namespace tabdock
{
    // global style of a `DockArea`
    struct DockStyle final {
        friend bool operator==(const DockStyle&, const DockStyle&) = default;

        TabStyle tab;
        Color tab_bar_bg_fill = {0.1f, 0.1f, 0.1f, 1.0f};
        Vec2 window_default_size = {400.0f, 300.0f};
    };
}
