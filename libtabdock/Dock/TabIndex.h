#pragma once

#include <libtabdock/Utils/StrongIndex.h>

namespace tabdock
{
    // identifies a tab within a `Node`
    using TabIndex = StrongIndex<struct TabIndexTag>;
}
