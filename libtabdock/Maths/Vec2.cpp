#include "Vec2.h"

#include <ostream>

std::ostream& tabdock::operator<<(std::ostream& o, const Vec2& v)
{
    return o << "Vec2(" << v.x << ", " << v.y << ')';
}
