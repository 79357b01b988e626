#pragma once

#include <libtabdock/Dock/TabId.h>
#include <libtabdock/Dock/TabIndex.h>
#include <libtabdock/Maths/Rect.h>
#include <libtabdock/Utils/Assertions.h>

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tabdock
{
    // a leaf in a `Surface`: an ordered list of tabs, one of which is active
    template<typename TTab>
    class Node final {
    public:
        Node() = default;
        explicit Node(std::vector<TTab> tabs) : tabs_{std::move(tabs)} {}

        bool empty() const { return tabs_.empty(); }
        size_t num_tabs() const { return tabs_.size(); }

        std::span<TTab> upd_tabs() { return tabs_; }
        std::span<const TTab> tabs() const { return tabs_; }

        TTab* try_upd_tab(TabIndex index)
        {
            return index.get() < tabs_.size() ? &tabs_[index.get()] : nullptr;
        }

        const TTab* find_tab(TabIndex index) const
        {
            return index.get() < tabs_.size() ? &tabs_[index.get()] : nullptr;
        }

        // Returns the index of the active tab, or `std::nullopt` if the node is empty.
        std::optional<TabIndex> active_tab_index() const
        {
            if (tabs_.empty()) {
                return std::nullopt;
            }
            return active_;
        }

        TTab* try_upd_active_tab()
        {
            return tabs_.empty() ? nullptr : &tabs_[active_.get()];
        }

        const TTab* find_active_tab() const
        {
            return tabs_.empty() ? nullptr : &tabs_[active_.get()];
        }

        // Makes the given tab active, and asks the host to select it in the UI.
        void set_active_tab(TabIndex index)
        {
            if (index.get() >= tabs_.size()) {
                throw std::out_of_range{"tried to activate a tab index that is out of range"};
            }
            active_ = index;
            selection_request_ = index;
        }

        // Records that the UI has shown `index` as the selected tab.
        void set_active_tab_from_ui(TabIndex index)
        {
            if (index.get() >= tabs_.size()) {
                return;
            }
            active_ = index;
            if (selection_request_ == index) {
                selection_request_.reset();
            }
        }

        // Asks the host to re-select the current active tab in the UI (e.g. after
        // the UI dropped its selection because a close button was pressed).
        void resync_selection()
        {
            if (not tabs_.empty()) {
                selection_request_ = active_;
            }
        }

        std::optional<TabIndex> selection_request() const { return selection_request_; }

        // Appends `tab` to the node and makes it the active tab.
        TabIndex push_tab(TTab tab)
        {
            tabs_.push_back(std::move(tab));
            const TabIndex index{tabs_.size() - 1};
            set_active_tab(index);
            return index;
        }

        // Removes the given tab and returns it.
        //
        // If it was the active tab, its left neighbor (or, if there isn't one, the
        // new first tab) becomes active.
        TTab remove_tab(TabIndex index)
        {
            if (index.get() >= tabs_.size()) {
                throw std::out_of_range{"tried to remove a tab index that is out of range"};
            }

            TTab rv = std::move(tabs_[index.get()]);
            tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(index.get()));
            on_tab_erased(index);
            return rv;
        }

        // Removes all tabs for which `predicate(tab)` returns `false`.
        template<typename Predicate>
        void retain_tabs(Predicate predicate)
        {
            for (size_t i = tabs_.size(); i-- > 0;) {
                if (not predicate(tabs_[i])) {
                    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(i));
                    on_tab_erased(TabIndex{i});
                }
            }
        }

        // Records the body area that the host most recently drew `tab_id` into, returning
        // `true` if either the area or the tab occupying it differs from the previous call.
        bool update_viewport(const Rect& ui_rect, TabId tab_id)
        {
            const bool changed = ui_rect != viewport_ or tab_id != viewport_tab_;
            viewport_ = ui_rect;
            viewport_tab_ = tab_id;
            return changed;
        }

        const Rect& viewport() const { return viewport_; }

    private:
        void on_tab_erased(TabIndex erased)
        {
            if (selection_request_ == erased) {
                selection_request_.reset();
            }
            else if (selection_request_ and *selection_request_ > erased) {
                selection_request_ = TabIndex{selection_request_->get() - 1};
            }

            if (tabs_.empty()) {
                active_ = TabIndex{0};
                return;
            }

            if (erased < active_) {
                active_ = TabIndex{active_.get() - 1};
            }
            else if (erased == active_) {
                active_ = TabIndex{active_.get() > 0 ? active_.get() - 1 : 0};
                selection_request_ = active_;
            }
            TABDOCK_ASSERT(active_.get() < tabs_.size());
        }

        std::vector<TTab> tabs_;
        TabIndex active_{0};
        std::optional<TabIndex> selection_request_;
        Rect viewport_;
        std::optional<TabId> viewport_tab_;
    };
}
