#pragma once

#include <libtabdock/Dock/Node.h>
#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Dock/Surface.h>
#include <libtabdock/Dock/SurfaceIndex.h>
#include <libtabdock/Dock/TabIndex.h>
#include <libtabdock/Dock/TabPath.h>

#include <concepts>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tabdock
{
    // the tree of tabs that a `DockArea` draws
    //
    // Surface slot 0 is always the main surface; every other slot is either a
    // window or empty. Removing a window empties its slot rather than erasing
    // it, so that existing `SurfaceIndex`es (and, therefore, `TabPath`s into
    // other surfaces) stay valid.
    template<typename TTab>
    class DockState final {
    public:
        explicit DockState(std::vector<TTab> tabs = {})
        {
            surfaces_.emplace_back(Surface<TTab>::main(std::move(tabs)));
        }

        Surface<TTab>& main_surface() { return *surfaces_.front(); }
        const Surface<TTab>& main_surface() const { return *surfaces_.front(); }

        // Returns the number of surface slots, including empty ones.
        size_t num_surface_slots() const { return surfaces_.size(); }

        const Surface<TTab>* find_surface(SurfaceIndex index) const
        {
            if (index.get() >= surfaces_.size() or not surfaces_[index.get()]) {
                return nullptr;
            }
            return &*surfaces_[index.get()];
        }

        Surface<TTab>* try_upd_surface(SurfaceIndex index)
        {
            if (index.get() >= surfaces_.size() or not surfaces_[index.get()]) {
                return nullptr;
            }
            return &*surfaces_[index.get()];
        }

        Surface<TTab>& upd_surface(SurfaceIndex index)
        {
            if (Surface<TTab>* surface = try_upd_surface(index)) {
                return *surface;
            }
            throw std::out_of_range{"tried to access a surface that does not exist"};
        }

        const Surface<TTab>& get_surface(SurfaceIndex index) const
        {
            if (const Surface<TTab>* surface = find_surface(index)) {
                return *surface;
            }
            throw std::out_of_range{"tried to access a surface that does not exist"};
        }

        // Adds a new window surface that contains `tabs` in a single leaf.
        SurfaceIndex add_window(std::vector<TTab> tabs, WindowPlacement placement = {})
        {
            surfaces_.emplace_back(Surface<TTab>::window(std::move(tabs), placement));
            return SurfaceIndex{surfaces_.size() - 1};
        }

        // Removes the given window, and all of its tabs, from the state.
        void remove_window(SurfaceIndex index)
        {
            if (index == main_surface_index()) {
                throw std::invalid_argument{"the main surface cannot be removed"};
            }
            if (not find_surface(index)) {
                throw std::out_of_range{"tried to remove a window that does not exist"};
            }
            surfaces_[index.get()].reset();
            if (focused_ and focused_->surface == index) {
                focused_.reset();
            }
        }

        // Adds an additional leaf to the given surface.
        NodeIndex add_leaf(SurfaceIndex surface, std::vector<TTab> tabs = {})
        {
            return upd_surface(surface).add_node(Node<TTab>{std::move(tabs)});
        }

        std::optional<TabPath> find_tab(const TTab& tab) const
            requires std::equality_comparable<TTab>
        {
            return find_tab_if([&tab](const TTab& t) { return t == tab; });
        }

        template<typename Predicate>
        std::optional<TabPath> find_tab_if(Predicate predicate) const
        {
            std::optional<TabPath> rv;
            for_each_tab([&rv, &predicate](const TabPath& path, const TTab& tab)
            {
                if (not rv and predicate(tab)) {
                    rv = path;
                }
            });
            return rv;
        }

        TTab* try_upd_tab(const TabPath& path)
        {
            if (Surface<TTab>* surface = try_upd_surface(path.surface)) {
                if (Node<TTab>* node = surface->try_upd_node(path.node)) {
                    return node->try_upd_tab(path.tab);
                }
            }
            return nullptr;
        }

        const TTab* find_tab_at(const TabPath& path) const
        {
            if (const Surface<TTab>* surface = find_surface(path.surface)) {
                if (const Node<TTab>* node = surface->find_node(path.node)) {
                    return node->find_tab(path.tab);
                }
            }
            return nullptr;
        }

        TTab& upd_tab(const TabPath& path)
        {
            if (TTab* tab = try_upd_tab(path)) {
                return *tab;
            }
            throw std::out_of_range{"tried to access a tab that does not exist"};
        }

        const TTab& get_tab(const TabPath& path) const
        {
            if (const TTab* tab = find_tab_at(path)) {
                return *tab;
            }
            throw std::out_of_range{"tried to access a tab that does not exist"};
        }

        // Pushes `tab` into the focused leaf (or, if no leaf is focused, the first
        // leaf of the main surface) and makes it active.
        TabPath push_to_focused_leaf(TTab tab)
        {
            const LeafLocation leaf = focused_.value_or(LeafLocation{main_surface_index(), NodeIndex{0}});
            Node<TTab>& node = upd_surface(leaf.surface).upd_node(leaf.node);
            const TabIndex index = node.push_tab(std::move(tab));
            return {leaf.surface, leaf.node, index};
        }

        // Pushes `tab` into the first leaf of the main surface and makes it active.
        TabPath push_to_first_leaf(TTab tab)
        {
            const TabIndex index = main_surface().upd_node(NodeIndex{0}).push_tab(std::move(tab));
            return {main_surface_index(), NodeIndex{0}, index};
        }

        // Removes the given tab from the state and returns it.
        //
        // If the tab was the last one in a window, the window is also removed.
        TTab remove_tab(const TabPath& path)
        {
            Surface<TTab>& surface = upd_surface(path.surface);
            TTab rv = surface.upd_node(path.node).remove_tab(path.tab);
            if (not surface.is_main() and surface.has_no_tabs()) {
                remove_window(path.surface);
            }
            return rv;
        }

        // Makes the given tab the active tab of its leaf.
        void set_active_tab(const TabPath& path)
        {
            upd_surface(path.surface).upd_node(path.node).set_active_tab(path.tab);
        }

        std::optional<LeafLocation> focused_leaf() const { return focused_; }

        void set_focused_node_and_surface(LeafLocation leaf)
        {
            if (not find_surface(leaf.surface) or not find_surface(leaf.surface)->find_node(leaf.node)) {
                throw std::out_of_range{"tried to focus a leaf that does not exist"};
            }
            focused_ = leaf;
        }

        // Returns the path to the active tab of the focused leaf, if there is one.
        std::optional<TabPath> find_active_focused() const
        {
            if (not focused_) {
                return std::nullopt;
            }
            const Surface<TTab>* surface = find_surface(focused_->surface);
            if (not surface) {
                return std::nullopt;
            }
            const Node<TTab>* node = surface->find_node(focused_->node);
            if (not node) {
                return std::nullopt;
            }
            if (const auto active = node->active_tab_index()) {
                return TabPath{focused_->surface, focused_->node, *active};
            }
            return std::nullopt;
        }

        // Moves the given tab into a new window, returning the window's index.
        SurfaceIndex detach_tab(const TabPath& path, WindowPlacement placement = {})
        {
            std::vector<TTab> tabs;
            tabs.push_back(remove_tab(path));
            const SurfaceIndex window = add_window(std::move(tabs), placement);
            focused_ = LeafLocation{window, NodeIndex{0}};
            return window;
        }

        size_t num_tabs() const
        {
            size_t rv = 0;
            for (const auto& surface : surfaces_) {
                if (surface) {
                    rv += surface->num_tabs();
                }
            }
            return rv;
        }

        // Calls `callback(TabPath, TTab&)` for every tab, surface by surface, node by node.
        template<typename Callback>
        void for_each_tab(Callback&& callback)
        {
            for (size_t s = 0; s < surfaces_.size(); ++s) {
                if (not surfaces_[s]) {
                    continue;
                }
                auto nodes = surfaces_[s]->upd_nodes();
                for (size_t n = 0; n < nodes.size(); ++n) {
                    auto tabs = nodes[n].upd_tabs();
                    for (size_t t = 0; t < tabs.size(); ++t) {
                        callback(TabPath{SurfaceIndex{s}, NodeIndex{n}, TabIndex{t}}, tabs[t]);
                    }
                }
            }
        }

        template<typename Callback>
        void for_each_tab(Callback&& callback) const
        {
            for (size_t s = 0; s < surfaces_.size(); ++s) {
                if (not surfaces_[s]) {
                    continue;
                }
                auto nodes = surfaces_[s]->nodes();
                for (size_t n = 0; n < nodes.size(); ++n) {
                    auto tabs = nodes[n].tabs();
                    for (size_t t = 0; t < tabs.size(); ++t) {
                        callback(TabPath{SurfaceIndex{s}, NodeIndex{n}, TabIndex{t}}, tabs[t]);
                    }
                }
            }
        }

        // Removes every tab for which `predicate(tab)` returns `false`, and any
        // window that is left without tabs.
        template<typename Predicate>
        void retain_tabs(Predicate predicate)
        {
            for (size_t s = 0; s < surfaces_.size(); ++s) {
                if (not surfaces_[s]) {
                    continue;
                }
                for (Node<TTab>& node : surfaces_[s]->upd_nodes()) {
                    node.retain_tabs(predicate);
                }
                if (s != main_surface_index().get() and surfaces_[s]->has_no_tabs()) {
                    remove_window(SurfaceIndex{s});
                }
            }
        }

    private:
        std::vector<std::optional<Surface<TTab>>> surfaces_;
        std::optional<LeafLocation> focused_;
    };
}
