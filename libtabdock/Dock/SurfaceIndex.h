#pragma once

#include <libtabdock/Utils/StrongIndex.h>

namespace tabdock
{
    // identifies a `Surface` within a `DockState`
    //
    // `SurfaceIndex{0}` is always the main surface
    using SurfaceIndex = StrongIndex<struct SurfaceIndexTag>;

    constexpr SurfaceIndex main_surface_index() { return SurfaceIndex{0}; }
}
