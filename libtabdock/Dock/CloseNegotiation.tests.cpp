#include "CloseNegotiation.h"

#include <libtabdock/Dock/DockState.h>
#include <libtabdock/Dock/OnCloseResponse.h>
#include <libtabdock/Dock/TabPath.h>

#include <gtest/gtest.h>
#include <testtabdock/TestingHelpers.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace tabdock;
using namespace tabdock::testing;

namespace
{
    TestTab make_tab(std::string title, OnCloseResponse response = OnCloseResponse::Close, bool closeable = true)
    {
        TestTab rv{std::move(title)};
        rv.close_response = response;
        rv.closeable = closeable;
        return rv;
    }

    constexpr TabPath c_second_tab_path = {main_surface_index(), NodeIndex{0}, TabIndex{1}};
}

TEST(negotiate_tab_close, close_response_removes_the_tab_before_returning)
{
    DockState<TestTab> state{{make_tab("a"), make_tab("b")}};
    RecordingTabViewer viewer;

    const CloseOutcome outcome = negotiate_tab_close(state, viewer, c_second_tab_path);

    ASSERT_EQ(outcome, CloseOutcome::Closed);
    ASSERT_EQ(state.num_tabs(), 1);
    ASSERT_FALSE(state.find_tab_if([](const TestTab& t) { return t.title == "b"; }));
    ASSERT_EQ(viewer.count("on_close", "b"), 1);
}

TEST(negotiate_tab_close, focus_response_keeps_the_tab_and_makes_it_active_and_focused)
{
    DockState<TestTab> state{{make_tab("a"), make_tab("b", OnCloseResponse::Focus)}};
    RecordingTabViewer viewer;
    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).active_tab_index(), TabIndex{0});

    const CloseOutcome outcome = negotiate_tab_close(state, viewer, c_second_tab_path);

    ASSERT_EQ(outcome, CloseOutcome::Focused);
    ASSERT_EQ(state.num_tabs(), 2);
    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).active_tab_index(), TabIndex{1});
    ASSERT_EQ(state.focused_leaf(), c_second_tab_path.leaf());
    ASSERT_EQ(state.find_active_focused(), c_second_tab_path);
}

TEST(negotiate_tab_close, ignore_response_changes_nothing)
{
    DockState<TestTab> state{{make_tab("a"), make_tab("b", OnCloseResponse::Ignore)}};
    const NodeIndex other = state.add_leaf(main_surface_index(), {make_tab("c")});
    state.set_focused_node_and_surface({main_surface_index(), other});
    RecordingTabViewer viewer;

    const CloseOutcome outcome = negotiate_tab_close(state, viewer, c_second_tab_path);

    ASSERT_EQ(outcome, CloseOutcome::Ignored);
    ASSERT_EQ(state.num_tabs(), 3);
    ASSERT_EQ(state.get_tab(c_second_tab_path).title, "b");
    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).active_tab_index(), TabIndex{0});
    ASSERT_EQ(state.focused_leaf(), (LeafLocation{main_surface_index(), other}));
    ASSERT_EQ(viewer.count("on_close", "b"), 1);
}

TEST(negotiate_tab_close, never_calls_on_close_for_uncloseable_tabs)
{
    DockState<TestTab> state{{make_tab("a"), make_tab("b", OnCloseResponse::Close, false)}};
    RecordingTabViewer viewer;

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(negotiate_tab_close(state, viewer, c_second_tab_path), CloseOutcome::NotCloseable);
    }

    ASSERT_EQ(viewer.count("on_close"), 0);
    ASSERT_EQ(viewer.count("is_closeable", "b"), 3);
    ASSERT_EQ(state.num_tabs(), 2);
}

TEST(negotiate_tab_close, consults_is_closeable_before_on_close)
{
    DockState<TestTab> state{{make_tab("a")}};
    RecordingTabViewer viewer;

    negotiate_tab_close(state, viewer, {main_surface_index(), NodeIndex{0}, TabIndex{0}});

    ASSERT_LT(viewer.index_of("is_closeable", "a"), viewer.index_of("on_close", "a"));
}

TEST(negotiate_tab_close, closing_the_last_tab_of_a_window_removes_the_window)
{
    DockState<TestTab> state;
    const SurfaceIndex window = state.add_window({make_tab("w")});
    RecordingTabViewer viewer;

    ASSERT_EQ(negotiate_tab_close(state, viewer, {window, NodeIndex{0}, TabIndex{0}}), CloseOutcome::Closed);
    ASSERT_EQ(state.find_surface(window), nullptr);
}

TEST(negotiate_tab_close, ignore_response_leaves_the_dock_state_as_it_was)
{
    DockState<TestTab> state{{make_tab("a", OnCloseResponse::Ignore), make_tab("b")}};
    const DockState<TestTab> before = state;
    RecordingTabViewer viewer;

    ASSERT_EQ(negotiate_tab_close(state, viewer, {main_surface_index(), NodeIndex{0}, TabIndex{0}}), CloseOutcome::Ignored);
    ASSERT_EQ(state.num_tabs(), before.num_tabs());
    ASSERT_EQ(state.find_active_focused(), before.find_active_focused());
}

TEST(negotiate_tab_close, terminates_if_the_viewer_returns_an_out_of_range_response)
{
    DockState<TestTab> state{{make_tab("a", OnCloseResponse::NUM_OPTIONS)}};
    RecordingTabViewer viewer;

    ASSERT_DEATH({ negotiate_tab_close(state, viewer, {main_surface_index(), NodeIndex{0}, TabIndex{0}}); }, "invalid OnCloseResponse");
}

TEST(negotiate_tab_close, throws_for_a_missing_tab)
{
    DockState<TestTab> state{{make_tab("a")}};
    RecordingTabViewer viewer;

    ASSERT_THROW({ negotiate_tab_close(state, viewer, c_second_tab_path); }, std::out_of_range);
    ASSERT_TRUE(viewer.calls().empty());
}

TEST(apply_forced_close, removes_the_tab_without_calling_on_close)
{
    TestTab b = make_tab("b");
    b.wants_force_close = true;
    DockState<TestTab> state{{make_tab("a"), b}};
    RecordingTabViewer viewer;

    ASSERT_TRUE(apply_forced_close(state, viewer, c_second_tab_path));

    ASSERT_EQ(state.num_tabs(), 1);
    ASSERT_EQ(viewer.count("on_close"), 0);
    ASSERT_EQ(viewer.count("force_close", "b"), 1);
}

TEST(apply_forced_close, ignores_is_closeable)
{
    TestTab b = make_tab("b", OnCloseResponse::Ignore, false);
    b.wants_force_close = true;
    DockState<TestTab> state{{make_tab("a"), b}};
    RecordingTabViewer viewer;

    ASSERT_TRUE(apply_forced_close(state, viewer, c_second_tab_path));

    ASSERT_EQ(state.num_tabs(), 1);
    ASSERT_EQ(viewer.count("is_closeable"), 0);
    ASSERT_EQ(viewer.count("on_close"), 0);
}

TEST(apply_forced_close, keeps_the_tab_when_the_viewer_returns_false)
{
    DockState<TestTab> state{{make_tab("a"), make_tab("b")}};
    RecordingTabViewer viewer;

    ASSERT_FALSE(apply_forced_close(state, viewer, c_second_tab_path));
    ASSERT_EQ(state.num_tabs(), 2);
}

TEST(CloseOutcome, can_be_printed)
{
    std::stringstream ss;
    ss << CloseOutcome::NotCloseable << ' ' << CloseOutcome::Closed << ' ' << CloseOutcome::Focused << ' ' << CloseOutcome::Ignored;
    ASSERT_EQ(ss.str(), "NotCloseable Closed Focused Ignored");
}
