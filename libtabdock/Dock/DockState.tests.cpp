#include "DockState.h"

#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Dock/SurfaceIndex.h>
#include <libtabdock/Dock/TabIndex.h>
#include <libtabdock/Dock/TabPath.h>

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tabdock;

namespace
{
    std::vector<std::string> tabs_of(const DockState<std::string>& state, SurfaceIndex surface = main_surface_index(), NodeIndex node = NodeIndex{0})
    {
        const auto tabs = state.get_surface(surface).get_node(node).tabs();
        return {tabs.begin(), tabs.end()};
    }

    std::optional<TabIndex> active_of(const DockState<std::string>& state, SurfaceIndex surface = main_surface_index(), NodeIndex node = NodeIndex{0})
    {
        return state.get_surface(surface).get_node(node).active_tab_index();
    }
}

TEST(DockState, default_constructed_has_an_empty_main_surface)
{
    const DockState<std::string> state;

    ASSERT_EQ(state.num_surface_slots(), 1);
    ASSERT_TRUE(state.main_surface().is_main());
    ASSERT_EQ(state.main_surface().num_nodes(), 1);
    ASSERT_EQ(state.num_tabs(), 0);
    ASSERT_EQ(active_of(state), std::nullopt);
}

TEST(DockState, constructed_tabs_are_placed_in_the_first_main_leaf_with_the_first_active)
{
    const DockState<std::string> state{{"a", "b", "c"}};

    ASSERT_EQ(tabs_of(state), (std::vector<std::string>{"a", "b", "c"}));
    ASSERT_EQ(active_of(state), TabIndex{0});
}

TEST(DockState, upd_surface_throws_for_missing_surfaces)
{
    DockState<std::string> state;

    ASSERT_THROW({ state.upd_surface(SurfaceIndex{3}); }, std::out_of_range);
    ASSERT_EQ(state.find_surface(SurfaceIndex{3}), nullptr);
}

TEST(DockState, get_tab_throws_for_missing_tabs)
{
    const DockState<std::string> state{{"a"}};

    ASSERT_EQ(state.get_tab({main_surface_index(), NodeIndex{0}, TabIndex{0}}), "a");
    ASSERT_THROW({ state.get_tab({main_surface_index(), NodeIndex{0}, TabIndex{1}}); }, std::out_of_range);
    ASSERT_THROW({ state.get_tab({main_surface_index(), NodeIndex{1}, TabIndex{0}}); }, std::out_of_range);
}

TEST(DockState, try_upd_tab_returns_nullptr_for_missing_tabs)
{
    DockState<std::string> state{{"a"}};

    ASSERT_NE(state.try_upd_tab({main_surface_index(), NodeIndex{0}, TabIndex{0}}), nullptr);
    ASSERT_EQ(state.try_upd_tab({main_surface_index(), NodeIndex{0}, TabIndex{5}}), nullptr);
    ASSERT_EQ(state.try_upd_tab({SurfaceIndex{9}, NodeIndex{0}, TabIndex{0}}), nullptr);
}

TEST(DockState, push_to_first_leaf_makes_the_pushed_tab_active)
{
    DockState<std::string> state{{"a"}};

    const TabPath path = state.push_to_first_leaf("b");

    ASSERT_EQ(path, (TabPath{main_surface_index(), NodeIndex{0}, TabIndex{1}}));
    ASSERT_EQ(active_of(state), TabIndex{1});
}

TEST(DockState, push_to_focused_leaf_uses_the_focused_leaf)
{
    DockState<std::string> state{{"a"}};
    const NodeIndex second = state.add_leaf(main_surface_index(), {"x"});
    state.set_focused_node_and_surface({main_surface_index(), second});

    const TabPath path = state.push_to_focused_leaf("b");

    ASSERT_EQ(path.node, second);
    ASSERT_EQ(tabs_of(state, main_surface_index(), second), (std::vector<std::string>{"x", "b"}));
}

TEST(DockState, push_to_focused_leaf_falls_back_to_the_first_leaf)
{
    DockState<std::string> state;

    const TabPath path = state.push_to_focused_leaf("a");

    ASSERT_EQ(path, (TabPath{main_surface_index(), NodeIndex{0}, TabIndex{0}}));
}

TEST(DockState, removing_the_active_tab_activates_its_left_neighbor)
{
    DockState<std::string> state{{"a", "b", "c"}};
    state.set_active_tab({main_surface_index(), NodeIndex{0}, TabIndex{2}});

    const std::string removed = state.remove_tab({main_surface_index(), NodeIndex{0}, TabIndex{2}});

    ASSERT_EQ(removed, "c");
    ASSERT_EQ(active_of(state), TabIndex{1});
}

TEST(DockState, removing_the_first_active_tab_activates_the_new_first_tab)
{
    DockState<std::string> state{{"a", "b", "c"}};

    state.remove_tab({main_surface_index(), NodeIndex{0}, TabIndex{0}});

    ASSERT_EQ(tabs_of(state), (std::vector<std::string>{"b", "c"}));
    ASSERT_EQ(active_of(state), TabIndex{0});
}

TEST(DockState, removing_a_tab_before_the_active_tab_keeps_the_same_tab_active)
{
    DockState<std::string> state{{"a", "b", "c"}};
    state.set_active_tab({main_surface_index(), NodeIndex{0}, TabIndex{2}});

    state.remove_tab({main_surface_index(), NodeIndex{0}, TabIndex{0}});

    ASSERT_EQ(active_of(state), TabIndex{1});
    ASSERT_EQ(state.get_tab({main_surface_index(), NodeIndex{0}, *active_of(state)}), "c");
}

TEST(DockState, removing_a_tab_after_the_active_tab_does_not_change_the_active_tab)
{
    DockState<std::string> state{{"a", "b", "c"}};
    state.set_active_tab({main_surface_index(), NodeIndex{0}, TabIndex{1}});

    state.remove_tab({main_surface_index(), NodeIndex{0}, TabIndex{2}});

    ASSERT_EQ(active_of(state), TabIndex{1});
}

TEST(DockState, removing_the_last_main_tab_leaves_an_empty_main_surface)
{
    DockState<std::string> state{{"a"}};

    state.remove_tab({main_surface_index(), NodeIndex{0}, TabIndex{0}});

    ASSERT_EQ(state.num_tabs(), 0);
    ASSERT_EQ(active_of(state), std::nullopt);
    ASSERT_NE(state.find_surface(main_surface_index()), nullptr);
}

TEST(DockState, removing_the_last_tab_of_a_window_removes_the_window)
{
    DockState<std::string> state{{"a"}};
    const SurfaceIndex window = state.add_window({"w"});

    state.remove_tab({window, NodeIndex{0}, TabIndex{0}});

    ASSERT_EQ(state.find_surface(window), nullptr);
    ASSERT_EQ(state.num_surface_slots(), 2);  // the slot is kept, but empty
}

TEST(DockState, removing_a_window_keeps_later_surface_indices_valid)
{
    DockState<std::string> state;
    const SurfaceIndex first = state.add_window({"w1"});
    const SurfaceIndex second = state.add_window({"w2"});

    state.remove_window(first);

    ASSERT_EQ(state.get_tab({second, NodeIndex{0}, TabIndex{0}}), "w2");
}

TEST(DockState, remove_window_refuses_to_remove_the_main_surface)
{
    DockState<std::string> state{{"a"}};

    ASSERT_THROW({ state.remove_window(main_surface_index()); }, std::invalid_argument);
    ASSERT_THROW({ state.remove_window(SurfaceIndex{7}); }, std::out_of_range);
}

TEST(DockState, removing_the_focused_window_clears_focus)
{
    DockState<std::string> state;
    const SurfaceIndex window = state.add_window({"w"});
    state.set_focused_node_and_surface({window, NodeIndex{0}});

    state.remove_window(window);

    ASSERT_EQ(state.focused_leaf(), std::nullopt);
}

TEST(DockState, set_focused_node_and_surface_throws_for_missing_leaves)
{
    DockState<std::string> state;

    ASSERT_THROW({ state.set_focused_node_and_surface({main_surface_index(), NodeIndex{4}}); }, std::out_of_range);
}

TEST(DockState, find_active_focused_returns_the_active_tab_of_the_focused_leaf)
{
    DockState<std::string> state{{"a", "b"}};
    ASSERT_EQ(state.find_active_focused(), std::nullopt);

    state.set_active_tab({main_surface_index(), NodeIndex{0}, TabIndex{1}});
    state.set_focused_node_and_surface({main_surface_index(), NodeIndex{0}});

    ASSERT_EQ(state.find_active_focused(), (TabPath{main_surface_index(), NodeIndex{0}, TabIndex{1}}));
}

TEST(DockState, set_active_tab_throws_for_missing_tabs)
{
    DockState<std::string> state{{"a"}};

    ASSERT_THROW({ state.set_active_tab({main_surface_index(), NodeIndex{0}, TabIndex{1}}); }, std::out_of_range);
}

TEST(DockState, set_active_tab_raises_a_selection_request)
{
    DockState<std::string> state{{"a", "b"}};

    state.set_active_tab({main_surface_index(), NodeIndex{0}, TabIndex{1}});

    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).selection_request(), TabIndex{1});
}

TEST(DockState, find_tab_finds_tabs_in_any_surface)
{
    DockState<std::string> state{{"a"}};
    const SurfaceIndex window = state.add_window({"w1", "w2"});

    ASSERT_EQ(state.find_tab("w2"), (TabPath{window, NodeIndex{0}, TabIndex{1}}));
    ASSERT_EQ(state.find_tab("missing"), std::nullopt);
}

TEST(DockState, find_tab_if_returns_the_first_match)
{
    const DockState<std::string> state{{"apple", "avocado", "banana"}};

    const auto path = state.find_tab_if([](const std::string& tab) { return tab.starts_with('a'); });

    ASSERT_EQ(path, (TabPath{main_surface_index(), NodeIndex{0}, TabIndex{0}}));
}

TEST(DockState, detach_tab_moves_the_tab_into_a_new_focused_window)
{
    DockState<std::string> state{{"a", "b"}};

    const SurfaceIndex window = state.detach_tab({main_surface_index(), NodeIndex{0}, TabIndex{1}});

    ASSERT_EQ(tabs_of(state), (std::vector<std::string>{"a"}));
    ASSERT_EQ(tabs_of(state, window), (std::vector<std::string>{"b"}));
    ASSERT_FALSE(state.get_surface(window).is_main());
    ASSERT_EQ(state.focused_leaf(), (LeafLocation{window, NodeIndex{0}}));
}

TEST(DockState, detaching_the_only_tab_of_a_window_replaces_the_window)
{
    DockState<std::string> state;
    const SurfaceIndex first = state.add_window({"w"});

    const SurfaceIndex second = state.detach_tab({first, NodeIndex{0}, TabIndex{0}});

    ASSERT_EQ(state.find_surface(first), nullptr);
    ASSERT_EQ(tabs_of(state, second), (std::vector<std::string>{"w"}));
}

TEST(DockState, for_each_tab_visits_every_tab_with_its_path)
{
    DockState<std::string> state{{"a", "b"}};
    const SurfaceIndex window = state.add_window({"w"});

    std::vector<TabPath> paths;
    state.for_each_tab([&paths](const TabPath& path, std::string& tab)
    {
        tab += "!";
        paths.push_back(path);
    });

    ASSERT_EQ(paths.size(), 3);
    ASSERT_EQ(paths.back(), (TabPath{window, NodeIndex{0}, TabIndex{0}}));
    ASSERT_EQ(state.get_tab(paths.front()), "a!");
}

TEST(DockState, retain_tabs_removes_rejected_tabs_and_empty_windows)
{
    DockState<std::string> state{{"keep", "drop"}};
    const SurfaceIndex window = state.add_window({"drop"});

    state.retain_tabs([](const std::string& tab) { return tab != "drop"; });

    ASSERT_EQ(tabs_of(state), (std::vector<std::string>{"keep"}));
    ASSERT_EQ(state.find_surface(window), nullptr);
    ASSERT_EQ(state.num_tabs(), 1);
}

TEST(DockState, num_tabs_counts_tabs_in_every_surface_and_leaf)
{
    DockState<std::string> state{{"a", "b"}};
    state.add_leaf(main_surface_index(), {"c"});
    state.add_window({"d", "e"});

    ASSERT_EQ(state.num_tabs(), 5);
}
