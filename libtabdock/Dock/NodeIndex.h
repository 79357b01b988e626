#pragma once

#include <libtabdock/Utils/StrongIndex.h>

namespace tabdock
{
    // identifies a `Node` (leaf) within a `Surface`
    using NodeIndex = StrongIndex<struct NodeIndexTag>;
}
