#pragma once

#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Dock/SurfaceIndex.h>
#include <libtabdock/Dock/TabIndex.h>

#include <ostream>

namespace tabdock
{
    // the location of a leaf node within a `DockState`
    struct LeafLocation final {
        friend bool operator==(const LeafLocation&, const LeafLocation&) = default;

        friend std::ostream& operator<<(std::ostream& o, const LeafLocation& loc)
        {
            return o << "LeafLocation(surface = " << loc.surface << ", node = " << loc.node << ')';
        }

        SurfaceIndex surface;
        NodeIndex node;
    };

    // the full location of a tab within a `DockState`
    struct TabPath final {
        constexpr LeafLocation leaf() const { return {surface, node}; }

        friend bool operator==(const TabPath&, const TabPath&) = default;

        friend std::ostream& operator<<(std::ostream& o, const TabPath& path)
        {
            return o << "TabPath(surface = " << path.surface << ", node = " << path.node << ", tab = " << path.tab << ')';
        }

        SurfaceIndex surface;
        NodeIndex node;
        TabIndex tab;
    };
}
