#include "TabStyle.h"

#include <ostream>

std::ostream& tabdock::operator<<(std::ostream& o, const TabStyle& style)
{
    return o << "TabStyle(rounding = " << style.rounding
             << ", bg_fill = " << style.bg_fill
             << ", bg_fill_hovered = " << style.bg_fill_hovered
             << ", bg_fill_active = " << style.bg_fill_active
             << ", text_color = " << style.text_color
             << ", body_bg_fill = " << style.body_bg_fill << ')';
}
