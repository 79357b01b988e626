#include "OnCloseResponse.h"

#include <libtabdock/Utils/CStringView.h>

#include <array>
#include <cstddef>
#include <ostream>

namespace
{
    constexpr auto c_response_strings = std::to_array<tabdock::CStringView>({
        "Close",
        "Focus",
        "Ignore",
    });
    static_assert(c_response_strings.size() == static_cast<size_t>(tabdock::OnCloseResponse::NUM_OPTIONS));
}

tabdock::CStringView tabdock::to_cstringview(OnCloseResponse response)
{
    return c_response_strings.at(static_cast<size_t>(response));
}

std::ostream& tabdock::operator<<(std::ostream& o, OnCloseResponse response)
{
    return o << to_cstringview(response);
}
