#include "CStringView.h"

#include <ostream>
#include <string>
#include <string_view>

std::ostream& tabdock::operator<<(std::ostream& out, const CStringView& sv)
{
    return out << std::string_view{sv};
}

std::string tabdock::operator+(const char* lhs, const CStringView& rhs)
{
    return lhs + to_string(rhs);
}

std::string tabdock::operator+(const std::string& lhs, const CStringView& rhs)
{
    return lhs + to_string(rhs);
}
