#pragma once

#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Dock/SurfaceIndex.h>
#include <libtabdock/Maths/Rect.h>

namespace tabdock
{
    // the context a `TabViewer` draws into
    //
    // drawing itself goes through the `tabdock::ui` functions: this carries
    // where (in ui space, and in the dock tree) the content is being drawn
    class DrawContext final {
    public:
        explicit DrawContext(const Rect& ui_rect, SurfaceIndex surface = main_surface_index(), NodeIndex node = NodeIndex{0}) :
            ui_rect_{ui_rect},
            surface_{surface},
            node_{node}
        {}

        const Rect& ui_rect() const { return ui_rect_; }
        Vec2 dimensions() const { return ui_rect_.dimensions(); }
        SurfaceIndex surface() const { return surface_; }
        NodeIndex node() const { return node_; }

    private:
        Rect ui_rect_;
        SurfaceIndex surface_;
        NodeIndex node_;
    };
}
