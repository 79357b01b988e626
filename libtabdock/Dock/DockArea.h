#pragma once

#include <libtabdock/Dock/CloseNegotiation.h>
#include <libtabdock/Dock/DockAreaOptions.h>
#include <libtabdock/Dock/DockState.h>
#include <libtabdock/Dock/DockStyle.h>
#include <libtabdock/Dock/DrawContext.h>
#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Dock/SurfaceIndex.h>
#include <libtabdock/Dock/TabBodyFlags.h>
#include <libtabdock/Dock/TabButtonResponse.h>
#include <libtabdock/Dock/TabId.h>
#include <libtabdock/Dock/TabIndex.h>
#include <libtabdock/Dock/TabPath.h>
#include <libtabdock/Dock/TabStyle.h>
#include <libtabdock/Dock/TabViewer.h>
#include <libtabdock/Maths/Rect.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Platform/Log.h>
#include <libtabdock/UI/tabdockimgui.h>
#include <libtabdock/Utils/Assertions.h>

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

namespace tabdock
{
    // An immediate-mode host that draws a `DockState` and delegates every
    // tab-specific decision to a `TabViewer`.
    //
    // The area is long-lived (it remembers which duplicate tab ids it has
    // already warned about), while `on_draw` is called once per frame from
    // within whichever `ui::` panel the area should occupy.
    template<typename TTab>
    class DockArea final {
    public:
        explicit DockArea(
            DockState<TTab>& state,
            const DockAreaOptions& options = {},
            const DockStyle& style = {}) :

            state_{&state},
            options_{options},
            style_{style}
        {}

        const DockAreaOptions& options() const { return options_; }
        DockAreaOptions& upd_options() { return options_; }
        void set_options(const DockAreaOptions& options) { options_ = options; }

        const DockStyle& style() const { return style_; }
        DockStyle& upd_style() { return style_; }
        void set_style(const DockStyle& style) { style_ = style; }

        // Draws the main surface into the current panel, and each window surface
        // as a separate floating panel, calling into `viewer` for each tab.
        void on_draw(TabViewer<TTab>& viewer)
        {
            ids_seen_this_frame_.clear();

            ui::push_id(static_cast<const void*>(this));
            draw_surface_leaves(main_surface_index(), viewer);
            ui::pop_id();

            // windows created while drawing the main surface (e.g. by ejecting a tab) are drawn this frame,
            // windows created while drawing another window are drawn from the next frame
            const size_t num_slots = state_->num_surface_slots();
            for (size_t i = 1; i < num_slots; ++i) {
                if (state_->find_surface(SurfaceIndex{i})) {
                    draw_window(SurfaceIndex{i}, viewer);
                }
            }
        }

    private:
        enum class TabAction {
            PollForceClose,
            Close,
            Eject,
        };

        struct PendingAction final {
            TabIndex tab;
            TabAction action;
            Rect tab_button_rect;
        };

        void draw_window(SurfaceIndex surface_index, TabViewer<TTab>& viewer)
        {
            const WindowPlacement placement = state_->get_surface(surface_index).placement();
            if (placement.position) {
                ui::set_next_panel_ui_position(*placement.position, ui::Conditional::Once);
            }
            ui::set_next_panel_size(placement.size.value_or(style_.window_default_size), ui::Conditional::Once);

            ui::PanelFlags flags = ui::PanelFlag::NoSavedSettings;
            if (not options_.show_window_collapse_buttons) {
                flags |= ui::PanelFlag::NoCollapse;
            }

            const std::string name = "###tabdock_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)) + "_window_" + std::to_string(surface_index.get());
            bool open = true;
            if (ui::begin_panel(name, options_.show_window_close_buttons ? &open : nullptr, flags)) {
                draw_surface_leaves(surface_index, viewer);
            }
            ui::end_panel();

            if (not open) {
                close_window(surface_index, viewer);
            }
        }

        // negotiates closing each tab in the window: tabs that refuse keep the window alive,
        // and a window that ends up with no tabs is removed
        void close_window(SurfaceIndex surface_index, TabViewer<TTab>& viewer)
        {
            if (not state_->find_surface(surface_index)) {
                return;
            }

            std::vector<TabPath> paths;
            state_->for_each_tab([surface_index, &paths](const TabPath& path, const TTab&)
            {
                if (path.surface == surface_index) {
                    paths.push_back(path);
                }
            });

            // highest index first, so that removals don't invalidate the remaining paths
            for (const TabPath& path : std::views::reverse(paths)) {
                if (not state_->find_tab_at(path)) {
                    break;  // the window was removed along with its last tab
                }
                negotiate_tab_close(*state_, viewer, path);
            }

            if (const Surface<TTab>* surface = state_->find_surface(surface_index); surface and surface->has_no_tabs()) {
                state_->remove_window(surface_index);
                log_info("closed empty window %zu", surface_index.get());
            }
        }

        void draw_surface_leaves(SurfaceIndex surface_index, TabViewer<TTab>& viewer)
        {
            const size_t num_nodes = state_->get_surface(surface_index).num_nodes();
            if (num_nodes == 0) {
                return;
            }
            const Vec2 available = ui::get_content_region_available();
            const float spacing = ui::get_style_item_spacing().x;
            const float leaf_width = (available.x - spacing*static_cast<float>(num_nodes - 1)) / static_cast<float>(num_nodes);

            for (size_t i = 0; i < num_nodes; ++i) {
                if (not state_->find_surface(surface_index)) {
                    break;  // removed by closing/ejecting its last tab
                }
                if (i > 0) {
                    ui::same_line();
                }
                draw_leaf(LeafLocation{surface_index, NodeIndex{i}}, {leaf_width, available.y}, viewer);
            }
        }

        void draw_leaf(const LeafLocation& leaf, Vec2 dimensions, TabViewer<TTab>& viewer)
        {
            std::vector<PendingAction> actions;
            bool wants_focus = false;

            ui::push_id(static_cast<int>(leaf.node.get()));
            ui::push_style_color(ui::ColorVar::ChildBg, style_.tab_bar_bg_fill);
            ui::begin_child_panel("##leaf", dimensions, {}, {ui::PanelFlag::NoScrollbar, ui::PanelFlag::NoScrollWithMouse});
            ui::pop_style_color();
            if (ui::begin_tab_bar("##tabs", ui::TabBarFlag::FittingPolicyScroll)) {
                const size_t num_tabs = state_->get_surface(leaf.surface).get_node(leaf.node).num_tabs();
                for (size_t i = 0; i < num_tabs; ++i) {
                    draw_tab(leaf, TabIndex{i}, actions, wants_focus, viewer);
                }
                if (options_.show_add_buttons) {
                    draw_add_button(leaf, viewer);
                }
                ui::end_tab_bar();
            }
            ui::end_child_panel();
            ui::pop_id();

            if (wants_focus) {
                state_->set_focused_node_and_surface(leaf);
            }
            apply_actions(leaf, actions, viewer);
        }

        void draw_tab(
            const LeafLocation& leaf,
            TabIndex tab_index,
            std::vector<PendingAction>& actions,
            bool& wants_focus,
            TabViewer<TTab>& viewer)
        {
            Node<TTab>& node = state_->upd_surface(leaf.surface).upd_node(leaf.node);
            TTab* const maybe_tab = node.try_upd_tab(tab_index);
            TABDOCK_ASSERT_ALWAYS(maybe_tab != nullptr && "the viewer changed the dock state while it was being drawn");
            TTab& tab = *maybe_tab;

            const TabId id = viewer.id(tab);
            warn_if_duplicate(id);
            const std::string title = viewer.title(tab);
            const bool closeable = viewer.is_closeable(tab);
            const TabStyle tab_style = resolve_tab_style(viewer, tab, style_.tab);
            const bool show_close_button = options_.show_close_buttons and closeable;

            ui::push_id_from_hash(id.value());

            ui::TabItemFlags flags = ui::TabItemFlag::NoTooltip;
            if (node.selection_request() == tab_index) {
                flags |= ui::TabItemFlag::SetSelected;
            }

            ui::push_style_color(ui::ColorVar::Tab, tab_style.bg_fill);
            ui::push_style_color(ui::ColorVar::TabHovered, tab_style.bg_fill_hovered);
            ui::push_style_color(ui::ColorVar::TabActive, tab_style.bg_fill_active);
            ui::push_style_color(ui::ColorVar::Text, tab_style.text_color);
            ui::push_style_var(ui::StyleVar::TabRounding, tab_style.rounding);
            bool open = true;
            const bool selected = ui::begin_tab_item(title + "###tab", show_close_button ? &open : nullptr, flags);
            ui::pop_style_var();
            ui::pop_style_color(4);

            TabButtonResponse response;
            response.clicked = ui::is_item_clicked(ui::MouseButton::Left);
            response.secondary_clicked = ui::is_item_clicked(ui::MouseButton::Right);
            response.middle_clicked = ui::is_item_clicked(ui::MouseButton::Middle);
            response.hovered = ui::is_item_hovered();
            response.double_clicked = response.hovered and ui::is_mouse_double_clicked(ui::MouseButton::Left);
            response.rect = ui::get_item_ui_rect();
            viewer.on_tab_button(tab, response);

            if (response.clicked or response.secondary_clicked) {
                wants_focus = true;
            }
            if (response.middle_clicked and show_close_button) {
                actions.push_back({tab_index, TabAction::Close, response.rect});
            }
            if (not open) {
                actions.push_back({tab_index, TabAction::Close, response.rect});
            }

            if (options_.tab_context_menus and ui::begin_popup_context_menu("##tab_context_menu")) {
                draw_tab_context_menu(leaf, tab_index, tab, closeable, response.rect, actions, viewer);
                ui::end_popup();
            }

            if (options_.show_tab_name_on_hover and response.hovered) {
                ui::set_tooltip("%s", title.c_str());
            }

            if (selected) {
                // the UI shows a selection request one frame late: don't draw a tab that's about to be replaced
                const bool replaced = node.selection_request() and node.selection_request() != tab_index;
                if (not replaced) {
                    node.set_active_tab_from_ui(tab_index);
                    draw_tab_body(leaf, tab, id, tab_style, wants_focus, viewer);
                    actions.push_back({tab_index, TabAction::PollForceClose, response.rect});
                }
                ui::end_tab_item();
            }

            ui::pop_id();
        }

        void draw_tab_context_menu(
            const LeafLocation& leaf,
            TabIndex tab_index,
            TTab& tab,
            bool closeable,
            const Rect& tab_button_rect,
            std::vector<PendingAction>& actions,
            TabViewer<TTab>& viewer)
        {
            DrawContext ctx{Rect::from_top_left_and_dimensions(ui::get_cursor_ui_position(), ui::get_content_region_available()), leaf.surface, leaf.node};
            viewer.on_draw_context_menu(ctx, tab, leaf.surface, leaf.node);

            const Surface<TTab>& surface = state_->get_surface(leaf.surface);
            const bool alone_in_window = not surface.is_main() and surface.num_tabs() == 1;
            const bool can_eject = viewer.allowed_in_windows(tab) and not alone_in_window;
            if (not can_eject and not closeable) {
                return;
            }

            ui::draw_separator();
            if (can_eject and ui::draw_menu_item("Eject")) {
                actions.push_back({tab_index, TabAction::Eject, tab_button_rect});
            }
            if (closeable and ui::draw_menu_item("Close")) {
                actions.push_back({tab_index, TabAction::Close, tab_button_rect});
            }
        }

        void draw_tab_body(
            const LeafLocation& leaf,
            TTab& tab,
            TabId id,
            const TabStyle& tab_style,
            bool& wants_focus,
            TabViewer<TTab>& viewer)
        {
            Node<TTab>& node = state_->upd_surface(leaf.surface).upd_node(leaf.node);

            const Rect body_rect = Rect::from_top_left_and_dimensions(ui::get_cursor_ui_position(), ui::get_content_region_available());
            if (viewer.clear_background(tab)) {
                ui::draw_rect_filled(body_rect, tab_style.body_bg_fill);
            }
            if (node.update_viewport(body_rect, id)) {
                viewer.on_rect_changed(tab);
            }

            const TabBodyFlags body_flags = to_body_panel_flags(viewer.scroll_bars(tab));
            if (ui::begin_child_panel("##body", body_rect.dimensions(), body_flags.child_panel_flags, body_flags.panel_flags)) {
                DrawContext ctx{body_rect, leaf.surface, leaf.node};
                viewer.on_draw(ctx, tab);

                if (ui::is_panel_hovered(ui::HoveredFlag::ChildPanels) and ui::is_mouse_clicked(ui::MouseButton::Left)) {
                    wants_focus = true;
                }
            }
            ui::end_child_panel();
        }

        void draw_add_button(const LeafLocation& leaf, TabViewer<TTab>& viewer)
        {
            if (ui::draw_tab_item_button("+")) {
                if (options_.show_add_popup) {
                    ui::open_popup("##add_popup");
                }
                else {
                    viewer.on_add(leaf.surface, leaf.node);
                }
            }

            if (options_.show_add_popup and ui::begin_popup("##add_popup")) {
                DrawContext ctx{Rect::from_top_left_and_dimensions(ui::get_cursor_ui_position(), ui::get_content_region_available()), leaf.surface, leaf.node};
                viewer.on_draw_add_popup(ctx, leaf.surface, leaf.node);
                ui::end_popup();
            }
        }

        // applies the actions that were requested while drawing a leaf, highest tab index first
        void apply_actions(const LeafLocation& leaf, std::vector<PendingAction>& actions, TabViewer<TTab>& viewer)
        {
            std::ranges::stable_sort(actions, [](const PendingAction& a, const PendingAction& b) { return a.tab > b.tab; });

            bool selection_dropped = false;
            for (auto it = actions.begin(); it != actions.end();) {
                const auto tab_end = std::find_if(it, actions.end(), [&it](const PendingAction& a) { return a.tab != it->tab; });
                const TabPath path{leaf.surface, leaf.node, it->tab};

                if (not state_->find_tab_at(path)) {
                    it = tab_end;
                    continue;
                }

                // a forced close takes precedence over anything the user requested for the tab
                const bool polls_force_close = std::any_of(it, tab_end, [](const PendingAction& a) { return a.action == TabAction::PollForceClose; });
                if (polls_force_close and apply_forced_close(*state_, viewer, path)) {
                    log_info("tab %zu in node %zu of surface %zu was closed by its viewer", path.tab.get(), path.node.get(), path.surface.get());
                    it = tab_end;
                    continue;
                }

                bool close_negotiated = false;
                for (; it != tab_end; ++it) {
                    if (it->action == TabAction::Close and not close_negotiated) {
                        close_negotiated = true;
                        selection_dropped = true;
                        if (negotiate_tab_close(*state_, viewer, path) == CloseOutcome::Closed) {
                            break;
                        }
                    }
                    else if (it->action == TabAction::Eject) {
                        const SurfaceIndex window = state_->detach_tab(path, WindowPlacement{.position = it->tab_button_rect.min_corner(), .size = std::nullopt});
                        log_info("ejected tab %zu in node %zu of surface %zu into window %zu", path.tab.get(), path.node.get(), path.surface.get(), window.get());
                        break;
                    }
                }
                it = tab_end;
            }

            // pressing a tab's close button deselects it in the UI, even if the viewer kept it
            if (selection_dropped) {
                if (Surface<TTab>* surface = state_->try_upd_surface(leaf.surface)) {
                    if (Node<TTab>* node = surface->try_upd_node(leaf.node); node and not node->selection_request()) {
                        node->resync_selection();
                    }
                }
            }
        }

        void warn_if_duplicate(TabId id)
        {
            if (not ids_seen_this_frame_.insert(id).second and warned_duplicate_ids_.insert(id).second) {
                log_warn("more than one visible tab has the id %zu: tab ids should be unique (see TabViewer::id)", id.value());
            }
        }

        DockState<TTab>* state_;
        DockAreaOptions options_;
        DockStyle style_;
        ankerl::unordered_dense::set<TabId> ids_seen_this_frame_;
        ankerl::unordered_dense::set<TabId> warned_duplicate_ids_;
    };
}
