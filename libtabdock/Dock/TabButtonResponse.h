#pragma once

#include <libtabdock/Maths/Rect.h>

namespace tabdock
{
    // the interaction result of drawing a tab's button in the tab bar
    struct TabButtonResponse final {
        bool clicked = false;
        bool secondary_clicked = false;
        bool middle_clicked = false;
        bool double_clicked = false;
        bool hovered = false;
        Rect rect;
    };
}
