#include "Color.h"

#include <ostream>

std::ostream& tabdock::operator<<(std::ostream& o, const Color& c)
{
    return o << "Color(r = " << c.r << ", g = " << c.g << ", b = " << c.b << ", a = " << c.a << ')';
}
