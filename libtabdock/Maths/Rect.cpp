#include "Rect.h"

#include <libtabdock/Maths/Vec2.h>

#include <ostream>

std::ostream& tabdock::operator<<(std::ostream& o, const Rect& rect)
{
    return o << "Rect(min = " << rect.min_corner() << ", max = " << rect.max_corner() << ')';
}
