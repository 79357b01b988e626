#pragma once

#include <libtabdock/Graphics/Color.h>

#include <iosfwd>

namespace tabdock
{
    // visual style of a single tab (its button and its body)
    struct TabStyle final {
        friend bool operator==(const TabStyle&, const TabStyle&) = default;

        float rounding = 4.0f;
        Color bg_fill = {0.11f, 0.15f, 0.17f, 1.0f};
        Color bg_fill_hovered = {0.26f, 0.59f, 0.98f, 0.80f};
        Color bg_fill_active = {0.20f, 0.25f, 0.29f, 1.0f};
        Color text_color = Color::white();
        Color body_bg_fill = {0.08f, 0.08f, 0.08f, 1.0f};
    };

    std::ostream& operator<<(std::ostream&, const TabStyle&);
}
