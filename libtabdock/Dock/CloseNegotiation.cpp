#include "CloseNegotiation.h"

#include <libtabdock/Utils/CStringView.h>

#include <array>
#include <cstddef>
#include <ostream>

namespace
{
    constexpr auto c_outcome_strings = std::to_array<tabdock::CStringView>({
        "NotCloseable",
        "Closed",
        "Focused",
        "Ignored",
    });
    static_assert(c_outcome_strings.size() == static_cast<size_t>(tabdock::CloseOutcome::NUM_OPTIONS));
}

tabdock::CStringView tabdock::to_cstringview(CloseOutcome outcome)
{
    return c_outcome_strings.at(static_cast<size_t>(outcome));
}

std::ostream& tabdock::operator<<(std::ostream& o, CloseOutcome outcome)
{
    return o << to_cstringview(outcome);
}
