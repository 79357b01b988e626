#pragma once

#include <libtabdock/Dock/DrawContext.h>
#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Dock/OnCloseResponse.h>
#include <libtabdock/Dock/ScrollBars.h>
#include <libtabdock/Dock/SurfaceIndex.h>
#include <libtabdock/Dock/TabButtonResponse.h>
#include <libtabdock/Dock/TabId.h>
#include <libtabdock/Dock/TabStyle.h>

#include <optional>
#include <string>

namespace tabdock
{
    // An abstract interface that a `DockArea` delegates all tab-specific
    // decisions to.
    //
    // `TTab` is the application's own (opaque) tab state. The host stores tabs
    // by value in a `DockState<TTab>` and lends them to these callbacks for the
    // duration of one call only. Implementations must not keep the reference,
    // or modify the dock tree from within a callback: structural changes go
    // through the host (e.g. by returning from `on_close` or `force_close`).
    //
    // Only `title` and `on_draw` are required. Every other operation has a
    // default that an implementation can override.
    template<typename TTab>
    class TabViewer {
    protected:
        TabViewer() = default;
        TabViewer(const TabViewer&) = default;
        TabViewer(TabViewer&&) noexcept = default;
        TabViewer& operator=(const TabViewer&) = default;
        TabViewer& operator=(TabViewer&&) noexcept = default;
    public:
        using Tab = TTab;

        virtual ~TabViewer() noexcept = default;

        // Returns the text shown in the tab's button.
        std::string title(Tab& tab) { return impl_title(tab); }

        // Draws the tab's body.
        void on_draw(DrawContext& ctx, Tab& tab) { impl_on_draw(ctx, tab); }

        // Draws the content of the tab's right-click context menu.
        void on_draw_context_menu(DrawContext& ctx, Tab& tab, SurfaceIndex surface, NodeIndex node)
        {
            impl_on_draw_context_menu(ctx, tab, surface, node);
        }

        // Returns a value that identifies `tab` across frames.
        //
        // Must be stable for an unchanged tab, and unique among the tabs that
        // are visible at the same time. Defaults to a hash of `title(tab)`.
        TabId id(Tab& tab) { return impl_id(tab); }

        // Called after the tab's button has been drawn.
        void on_tab_button(Tab& tab, const TabButtonResponse& response) { impl_on_tab_button(tab, response); }

        // Called when the user requests that `tab` is closed.
        OnCloseResponse on_close(Tab& tab) { return impl_on_close(tab); }

        // Returns `true` if the user may close `tab`. When `false`, no close
        // control is offered and `on_close` is never called for the tab.
        bool is_closeable(const Tab& tab) const { return impl_is_closeable(tab); }

        // Polled each frame, after `on_draw`, for the active tab of each drawn
        // leaf. Returning `true` removes the tab immediately, without calling
        // `on_close` or consulting `is_closeable`.
        bool force_close(Tab& tab) { return impl_force_close(tab); }

        // Called when the add button of the given leaf is pressed.
        void on_add(SurfaceIndex surface, NodeIndex node) { impl_on_add(surface, node); }

        // Called before `on_draw` whenever the area that `tab` is drawn into changes.
        void on_rect_changed(Tab& tab) { impl_on_rect_changed(tab); }

        // Draws the content of the given leaf's add popup.
        void on_draw_add_popup(DrawContext& ctx, SurfaceIndex surface, NodeIndex node)
        {
            impl_on_draw_add_popup(ctx, surface, node);
        }

        // Returns a style that should be used for `tab` instead of `global_style`,
        // or `std::nullopt` to use `global_style` unchanged.
        std::optional<TabStyle> tab_style_override(const Tab& tab, const TabStyle& global_style) const
        {
            return impl_tab_style_override(tab, global_style);
        }

        // Returns `true` if `tab` may be moved into a separate window.
        bool allowed_in_windows(Tab& tab) const { return impl_allowed_in_windows(tab); }

        // Returns `true` if the host should fill the tab's body with the style's
        // `body_bg_fill` before calling `on_draw`.
        bool clear_background(const Tab& tab) const { return impl_clear_background(tab); }

        // Returns which scroll bars the host should provision around the tab's body.
        ScrollBars scroll_bars(const Tab& tab) const { return impl_scroll_bars(tab); }

    private:
        virtual std::string impl_title(Tab&) = 0;
        virtual void impl_on_draw(DrawContext&, Tab&) = 0;
        virtual void impl_on_draw_context_menu(DrawContext&, Tab&, SurfaceIndex, NodeIndex) {}
        virtual TabId impl_id(Tab& tab) { return TabId::from_title(title(tab)); }
        virtual void impl_on_tab_button(Tab&, const TabButtonResponse&) {}
        virtual OnCloseResponse impl_on_close(Tab&) { return OnCloseResponse::Close; }
        virtual bool impl_is_closeable(const Tab&) const { return true; }
        virtual bool impl_force_close(Tab&) { return false; }
        virtual void impl_on_add(SurfaceIndex, NodeIndex) {}
        virtual void impl_on_rect_changed(Tab&) {}
        virtual void impl_on_draw_add_popup(DrawContext&, SurfaceIndex, NodeIndex) {}
        virtual std::optional<TabStyle> impl_tab_style_override(const Tab&, const TabStyle&) const { return std::nullopt; }
        virtual bool impl_allowed_in_windows(Tab&) const { return true; }
        virtual bool impl_clear_background(const Tab&) const { return true; }
        virtual ScrollBars impl_scroll_bars(const Tab&) const { return ScrollBars{}; }
    };

    // Returns the style that should be used to draw `tab`: the viewer's override,
    // if it supplies one, or a copy of `global_style`.
    template<typename TTab>
    TabStyle resolve_tab_style(const TabViewer<TTab>& viewer, const TTab& tab, const TabStyle& global_style)
    {
        return viewer.tab_style_override(tab, global_style).value_or(global_style);
    }
}
