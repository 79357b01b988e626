#pragma once

#include <libtabdock/Dock/DockState.h>
#include <libtabdock/Dock/OnCloseResponse.h>
#include <libtabdock/Dock/TabPath.h>
#include <libtabdock/Dock/TabViewer.h>
#include <libtabdock/Platform/Log.h>
#include <libtabdock/Utils/Assertions.h>
#include <libtabdock/Utils/CStringView.h>

#include <iosfwd>

namespace tabdock
{
    // what happened to a tab after a close was negotiated with its viewer
    enum class CloseOutcome {
        NotCloseable,  // `is_closeable` returned `false`, so `on_close` wasn't called
        Closed,
        Focused,
        Ignored,
        NUM_OPTIONS,
    };

    CStringView to_cstringview(CloseOutcome);
    std::ostream& operator<<(std::ostream&, CloseOutcome);

    // Handles a user's request to close the tab at `path`.
    //
    // Throws `std::out_of_range` if `path` doesn't point to a tab in `state`.
    template<typename TTab>
    CloseOutcome negotiate_tab_close(DockState<TTab>& state, TabViewer<TTab>& viewer, const TabPath& path)
    {
        TTab& tab = state.upd_tab(path);

        if (not viewer.is_closeable(tab)) {
            return CloseOutcome::NotCloseable;
        }

        switch (viewer.on_close(tab)) {
        case OnCloseResponse::Close:
            state.remove_tab(path);
            log_debug("closed tab %zu in node %zu of surface %zu", path.tab.get(), path.node.get(), path.surface.get());
            return CloseOutcome::Closed;
        case OnCloseResponse::Focus:
            state.set_active_tab(path);
            state.set_focused_node_and_surface(path.leaf());
            return CloseOutcome::Focused;
        case OnCloseResponse::Ignore:
            return CloseOutcome::Ignored;
        case OnCloseResponse::NUM_OPTIONS:
        default:
            TABDOCK_ASSERT_ALWAYS(false && "a viewer returned an invalid OnCloseResponse");
            return CloseOutcome::Ignored;
        }
    }

    // Polls `viewer.force_close` for the tab at `path` and, if it returns `true`,
    // removes the tab without calling `on_close` or `is_closeable`.
    //
    // Returns `true` if the tab was removed.
    template<typename TTab>
    bool apply_forced_close(DockState<TTab>& state, TabViewer<TTab>& viewer, const TabPath& path)
    {
        if (not viewer.force_close(state.upd_tab(path))) {
            return false;
        }

        state.remove_tab(path);
        log_debug("force-closed tab %zu in node %zu of surface %zu", path.tab.get(), path.node.get(), path.surface.get());
        return true;
    }
}
