#include "DockArea.h"

#include <libtabdock/Dock/DockAreaOptions.h>
#include <libtabdock/Dock/DockState.h>
#include <libtabdock/Dock/DrawContext.h>
#include <libtabdock/Dock/OnCloseResponse.h>
#include <libtabdock/Dock/ScrollBars.h>
#include <libtabdock/Dock/Surface.h>
#include <libtabdock/Dock/TabButtonResponse.h>
#include <libtabdock/Dock/TabId.h>
#include <libtabdock/Dock/TabStyle.h>
#include <libtabdock/Maths/Rect.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Platform/LogLevel.h>
#include <libtabdock/UI/tabdockimgui.h>

#include <gtest/gtest.h>
#include <testtabdock/TestingHelpers.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using namespace tabdock;
using namespace tabdock::testing;

namespace
{
    // enough frames for the UI to settle on a (requested) tab selection
    constexpr size_t c_settle_frames = 4;

    bool contains_tab(const DockState<TestTab>& state, std::string_view title)
    {
        return state.find_tab_if([title](const TestTab& tab) { return tab.title == title; }).has_value();
    }

    // where the given tab's button was drawn in the most recent frame
    Rect tab_button_rect(const RecordingTabViewer& viewer, std::string_view title)
    {
        const std::optional<TabButtonResponse> response = viewer.last_tab_button_response(title);
        EXPECT_TRUE(response.has_value()) << title << ": tab button was never drawn";
        return response ? response->rect : Rect{};
    }

    // center of the `i`th entry that the dock area appends (after a separator) to
    // a tab's context menu, given the `DrawContext` of the viewer's own content
    Vec2 context_menu_entry_center(const DrawContext& menu_context, size_t i)
    {
        const float line_height = ui::get_font_base_size();
        const float spacing = ui::get_style_item_spacing().y;
        const Vec2 start = menu_context.ui_rect().min_corner();
        return {
            start.x + line_height,
            start.y + spacing + static_cast<float>(i)*(line_height + spacing) + 0.5f*line_height,
        };
    }

    // a point inside the add button, which trails the last tab in a tab bar
    Vec2 add_button_position(const Rect& last_tab_button_rect)
    {
        return {
            last_tab_button_rect.max_corner().x + ui::get_style_item_inner_spacing().x + ui::get_style_frame_padding().x + 1.0f,
            last_tab_button_rect.origin().y,
        };
    }

    constexpr WindowPlacement c_test_window_placement = {.position = Vec2{200.0f, 200.0f}, .size = Vec2{300.0f, 200.0f}};

    Rect test_window_rect()
    {
        return Rect::from_top_left_and_dimensions(*c_test_window_placement.position, *c_test_window_placement.size);
    }
}

TEST(DockArea, draws_the_active_tab_of_the_main_surface)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_GE(viewer.count("on_draw", "a"), 1);
    ASSERT_EQ(viewer.count("on_draw", "b"), 0);
}

TEST(DockArea, queries_the_title_and_id_of_every_visible_tab_each_frame)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(3, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(viewer.count("title", "a"), 3);
    ASSERT_EQ(viewer.count("title", "b"), 3);
    ASSERT_EQ(viewer.count("id", "a"), 3);
    ASSERT_EQ(viewer.count("id", "b"), 3);
    ASSERT_EQ(viewer.count("on_tab_button", "b"), 3);
    ASSERT_EQ(viewer.count("tab_style_override", "b"), 3);
}

TEST(DockArea, draws_a_tab_that_was_made_active_programmatically)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    state.set_active_tab({main_surface_index(), NodeIndex{0}, TabIndex{1}});
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_GE(viewer.count("on_draw", "b"), 1);
    ASSERT_EQ(viewer.count("on_draw", "a"), 0);
    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).active_tab_index(), TabIndex{1});
}

TEST(DockArea, forced_close_removes_the_active_tab_after_drawing_it_without_calling_on_close)
{
    TestTab doomed{"doomed"};
    doomed.wants_force_close = true;
    doomed.closeable = false;
    DockState<TestTab> state{{doomed, TestTab{"other"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_FALSE(state.find_tab_if([](const TestTab& t) { return t.title == "doomed"; }));
    ASSERT_EQ(viewer.count("on_close"), 0);
    ASSERT_EQ(viewer.count("on_draw", "doomed"), 1);
    ASSERT_EQ(viewer.count("force_close", "doomed"), 1);
    ASSERT_LT(viewer.index_of("on_draw", "doomed"), viewer.index_of("force_close", "doomed"));
}

TEST(DockArea, never_polls_force_close_for_inactive_tabs)
{
    TestTab background{"background"};
    background.wants_force_close = true;
    DockState<TestTab> state{{TestTab{"foreground"}, background}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(viewer.count("force_close", "background"), 0);
    ASSERT_GE(viewer.count("force_close", "foreground"), 1);
    ASSERT_EQ(state.num_tabs(), 2);
}

TEST(DockArea, polls_force_close_after_each_on_draw_of_the_active_tab)
{
    DockState<TestTab> state{{TestTab{"a"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(viewer.count("force_close", "a"), viewer.count("on_draw", "a"));
    ASSERT_LT(viewer.last_index_of("on_draw", "a"), viewer.last_index_of("force_close", "a"));
}

TEST(DockArea, calls_on_rect_changed_before_the_first_on_draw)
{
    DockState<TestTab> state{{TestTab{"a"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frame([&]{ area.on_draw(viewer); });

    ASSERT_EQ(viewer.count("on_rect_changed", "a"), 1);
    ASSERT_LT(viewer.index_of("on_rect_changed", "a"), viewer.index_of("on_draw", "a"));
}

TEST(DockArea, does_not_call_on_rect_changed_while_the_layout_is_unchanged)
{
    DockState<TestTab> state{{TestTab{"a"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });
    viewer.clear_calls();
    driver.draw_frames(3, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(viewer.count("on_draw", "a"), 3);
    ASSERT_EQ(viewer.count("on_rect_changed", "a"), 0);
}

TEST(DockArea, calls_on_rect_changed_when_another_tab_takes_over_the_body)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });
    state.set_active_tab({main_surface_index(), NodeIndex{0}, TabIndex{1}});
    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(viewer.count("on_rect_changed", "b"), 1);
    ASSERT_LT(viewer.index_of("on_rect_changed", "b"), viewer.index_of("on_draw", "b"));
}

TEST(DockArea, consults_scroll_bars_and_clear_background_for_the_drawn_tab_only)
{
    TestTab a{"a"};
    a.scroll_bars = ScrollBars{false, false};
    DockState<TestTab> state{{a, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(viewer.count("scroll_bars", "a"), viewer.count("on_draw", "a"));
    ASSERT_EQ(viewer.count("clear_background", "a"), viewer.count("on_draw", "a"));
    ASSERT_EQ(viewer.count("scroll_bars", "b"), 0);
    ASSERT_EQ(viewer.count("clear_background", "b"), 0);
}

TEST(DockArea, passes_the_leaf_location_to_on_draw)
{
    DockState<TestTab> state{{TestTab{"a"}}};
    state.add_leaf(main_surface_index(), {TestTab{"b"}});
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_GE(viewer.count("on_draw", "a"), 1);
    ASSERT_GE(viewer.count("on_draw", "b"), 1);
    ASSERT_TRUE(viewer.last_draw_context().has_value());
    ASSERT_EQ(viewer.last_draw_context()->surface(), main_surface_index());
    ASSERT_EQ(viewer.last_draw_context()->node(), NodeIndex{1});
}

TEST(DockArea, side_by_side_leaves_get_non_overlapping_body_areas)
{
    DockState<TestTab> state{{TestTab{"left"}}};
    state.add_leaf(main_surface_index(), {TestTab{"right"}});
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    const Rect left = state.main_surface().get_node(NodeIndex{0}).viewport();
    const Rect right = state.main_surface().get_node(NodeIndex{1}).viewport();
    ASSERT_GT(left.width(), 0.0f);
    ASSERT_GT(right.width(), 0.0f);
    ASSERT_LE(left.max_corner().x, right.min_corner().x);
}

TEST(DockArea, draws_tabs_in_window_surfaces)
{
    DockState<TestTab> state{{TestTab{"main"}}};
    const SurfaceIndex window = state.add_window({TestTab{"floating"}});
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_GE(viewer.count("on_draw", "floating"), 1);
    ASSERT_EQ(viewer.last_draw_context()->surface(), window);
}

TEST(DockArea, forced_close_of_a_windows_last_tab_removes_the_window)
{
    TestTab floating{"floating"};
    floating.wants_force_close = true;
    DockState<TestTab> state{{TestTab{"main"}}};
    const SurfaceIndex window = state.add_window({floating});
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(state.find_surface(window), nullptr);
    ASSERT_EQ(viewer.count("on_close"), 0);
}

TEST(DockArea, draws_nothing_for_an_empty_state)
{
    DockState<TestTab> state;
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(2, [&]{ area.on_draw(viewer); });

    ASSERT_TRUE(viewer.calls().empty());
}

TEST(DockArea, warns_once_about_tabs_that_share_an_id)
{
    ScopedLogCapture capture;
    TestTab first{"first"};
    first.custom_id = TabId{7};
    TestTab second{"second"};
    second.custom_id = TabId{7};
    DockState<TestTab> state{{first, second}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(3, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(capture.sink().count(LogLevel::warn), 1);
}

TEST(DockArea, does_not_warn_about_unique_ids)
{
    ScopedLogCapture capture;
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(3, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(capture.sink().count(LogLevel::warn), 0);
}

TEST(DockArea, options_and_style_can_be_updated)
{
    DockState<TestTab> state;
    DockArea<TestTab> area{state};

    DockAreaOptions options;
    options.show_add_buttons = true;
    area.set_options(options);
    area.upd_style().tab.rounding = 0.0f;

    ASSERT_TRUE(area.options().show_add_buttons);
    ASSERT_EQ(area.style().tab.rounding, 0.0f);
}

TEST(DockArea, add_button_option_does_not_call_on_add_without_a_click)
{
    DockState<TestTab> state{{TestTab{"a"}}};
    DockAreaOptions options;
    options.show_add_buttons = true;
    options.show_add_popup = true;
    DockArea<TestTab> area{state, options};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;

    driver.draw_frames(c_settle_frames, [&]{ area.on_draw(viewer); });

    ASSERT_EQ(viewer.count("on_add"), 0);
    ASSERT_EQ(viewer.count("on_draw_add_popup"), 0);
    ASSERT_GE(viewer.count("on_draw", "a"), 1);
}

TEST(DockArea, clicking_an_inactive_tab_makes_it_active_and_draws_it)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(tab_button_rect(viewer, "b").origin(), ui::MouseButton::Left, draw);
    viewer.clear_calls();
    driver.draw_frames(c_settle_frames, draw);

    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).active_tab_index(), TabIndex{1});
    ASSERT_GE(viewer.count("on_draw", "b"), 1);
    ASSERT_EQ(viewer.count("on_draw", "a"), 0);
    ASSERT_EQ(state.focused_leaf(), (LeafLocation{main_surface_index(), NodeIndex{0}}));
}

TEST(DockArea, close_button_removes_a_tab_that_answers_close)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(close_button_center(tab_button_rect(viewer, "a")), ui::MouseButton::Left, draw);

    ASSERT_EQ(viewer.count("on_close", "a"), 1);
    ASSERT_FALSE(contains_tab(state, "a"));

    viewer.clear_calls();
    driver.draw_frames(c_settle_frames, draw);
    ASSERT_GE(viewer.count("on_draw", "b"), 1);
}

TEST(DockArea, close_button_answered_with_focus_keeps_the_tab_and_draws_it)
{
    TestTab b{"b"};
    b.close_response = OnCloseResponse::Focus;
    DockState<TestTab> state{{TestTab{"a"}, b}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(close_button_center(tab_button_rect(viewer, "b")), ui::MouseButton::Left, draw);

    ASSERT_EQ(viewer.count("on_close", "b"), 1);
    ASSERT_TRUE(contains_tab(state, "b"));
    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).active_tab_index(), TabIndex{1});

    viewer.clear_calls();
    driver.draw_frames(c_settle_frames, draw);
    ASSERT_GE(viewer.count("on_draw", "b"), 1);
    ASSERT_EQ(viewer.count("on_draw", "a"), 0);
    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).active_tab_index(), TabIndex{1});
}

TEST(DockArea, close_button_answered_with_ignore_keeps_drawing_the_active_tab)
{
    TestTab a{"a"};
    a.close_response = OnCloseResponse::Ignore;
    DockState<TestTab> state{{a, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(close_button_center(tab_button_rect(viewer, "a")), ui::MouseButton::Left, draw);

    ASSERT_EQ(viewer.count("on_close", "a"), 1);
    ASSERT_EQ(state.num_tabs(), 2);

    // the UI drops its selection when a close button is pressed: the area has to restore it
    viewer.clear_calls();
    driver.draw_frames(c_settle_frames, draw);
    ASSERT_GE(viewer.count("on_draw", "a"), 1);
    ASSERT_EQ(viewer.count("on_draw", "b"), 0);
    ASSERT_EQ(state.main_surface().get_node(NodeIndex{0}).active_tab_index(), TabIndex{0});
}

TEST(DockArea, middle_click_negotiates_closing_a_closeable_tab)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(tab_button_rect(viewer, "b").origin(), ui::MouseButton::Middle, draw);

    ASSERT_EQ(viewer.count("on_close", "b"), 1);
    ASSERT_FALSE(contains_tab(state, "b"));
    ASSERT_TRUE(contains_tab(state, "a"));
}

TEST(DockArea, uncloseable_tab_offers_no_close_control)
{
    TestTab a{"a"};
    a.closeable = false;
    DockState<TestTab> state{{a, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    const Rect a_rect = tab_button_rect(viewer, "a");
    driver.click(a_rect.origin(), ui::MouseButton::Middle, draw);
    driver.click(close_button_center(a_rect), ui::MouseButton::Left, draw);
    driver.draw_frames(c_settle_frames, draw);

    ASSERT_EQ(viewer.count("on_close"), 0);
    ASSERT_GE(viewer.count("is_closeable", "a"), 1);
    ASSERT_TRUE(contains_tab(state, "a"));
    ASSERT_EQ(state.num_tabs(), 2);
}

TEST(DockArea, context_menu_eject_moves_the_tab_into_a_new_window)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(tab_button_rect(viewer, "b").origin(), ui::MouseButton::Right, draw);
    driver.draw_frames(2, draw);  // let the menu find its final position
    ASSERT_GE(viewer.count("on_draw_context_menu", "b"), 1);
    ASSERT_TRUE(viewer.last_context_menu_context().has_value());

    driver.click(context_menu_entry_center(*viewer.last_context_menu_context(), 0), ui::MouseButton::Left, draw);

    ASSERT_EQ(state.num_surface_slots(), 2);
    const Surface<TestTab>* window = state.find_surface(SurfaceIndex{1});
    ASSERT_NE(window, nullptr);
    ASSERT_FALSE(window->is_main());
    ASSERT_EQ(window->num_tabs(), 1);
    ASSERT_EQ(state.main_surface().num_tabs(), 1);
    ASSERT_EQ(viewer.count("on_close"), 0);

    viewer.clear_calls();
    driver.draw_frames(c_settle_frames, draw);
    ASSERT_GE(viewer.count("on_draw", "b"), 1);
    ASSERT_EQ(viewer.last_draw_context()->surface(), SurfaceIndex{1});
}

TEST(DockArea, context_menu_close_negotiates_the_close)
{
    DockState<TestTab> state{{TestTab{"a"}, TestTab{"b"}}};
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(tab_button_rect(viewer, "b").origin(), ui::MouseButton::Right, draw);
    driver.draw_frames(2, draw);
    ASSERT_TRUE(viewer.last_context_menu_context().has_value());

    driver.click(context_menu_entry_center(*viewer.last_context_menu_context(), 1), ui::MouseButton::Left, draw);

    ASSERT_EQ(viewer.count("on_close", "b"), 1);
    ASSERT_FALSE(contains_tab(state, "b"));
    ASSERT_EQ(state.num_surface_slots(), 1);
}

TEST(DockArea, window_close_button_closes_the_windows_tabs_and_the_window)
{
    DockState<TestTab> state{{TestTab{"main"}}};
    const SurfaceIndex window = state.add_window({TestTab{"floating"}}, c_test_window_placement);
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(close_button_center(test_window_rect()), ui::MouseButton::Left, draw);

    ASSERT_EQ(viewer.count("on_close", "floating"), 1);
    ASSERT_EQ(state.find_surface(window), nullptr);
    ASSERT_TRUE(contains_tab(state, "main"));
}

TEST(DockArea, window_stays_open_while_one_of_its_tabs_refuses_to_close)
{
    TestTab stubborn{"stubborn"};
    stubborn.close_response = OnCloseResponse::Ignore;
    DockState<TestTab> state{{TestTab{"main"}}};
    const SurfaceIndex window = state.add_window({stubborn}, c_test_window_placement);
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(close_button_center(test_window_rect()), ui::MouseButton::Left, draw);

    ASSERT_EQ(viewer.count("on_close", "stubborn"), 1);
    ASSERT_NE(state.find_surface(window), nullptr);

    viewer.clear_calls();
    driver.draw_frames(c_settle_frames, draw);
    ASSERT_GE(viewer.count("on_draw", "stubborn"), 1);
}

TEST(DockArea, window_close_button_removes_a_window_with_no_tabs)
{
    DockState<TestTab> state{{TestTab{"main"}}};
    const SurfaceIndex window = state.add_window({}, c_test_window_placement);
    DockArea<TestTab> area{state};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    ASSERT_NE(state.find_surface(window), nullptr);
    driver.click(close_button_center(test_window_rect()), ui::MouseButton::Left, draw);

    ASSERT_EQ(state.find_surface(window), nullptr);
    ASSERT_EQ(viewer.count("on_close"), 0);
    ASSERT_TRUE(contains_tab(state, "main"));
}

TEST(DockArea, add_button_click_calls_on_add)
{
    DockState<TestTab> state{{TestTab{"a"}}};
    DockAreaOptions options;
    options.show_add_buttons = true;
    DockArea<TestTab> area{state, options};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(add_button_position(tab_button_rect(viewer, "a")), ui::MouseButton::Left, draw);

    ASSERT_EQ(viewer.count("on_add"), 1);
    ASSERT_EQ(viewer.count("on_draw_add_popup"), 0);
}

TEST(DockArea, add_button_click_opens_the_add_popup_instead_of_calling_on_add_when_enabled)
{
    DockState<TestTab> state{{TestTab{"a"}}};
    DockAreaOptions options;
    options.show_add_buttons = true;
    options.show_add_popup = true;
    DockArea<TestTab> area{state, options};
    RecordingTabViewer viewer;
    HeadlessFrameDriver driver;
    const auto draw = [&]{ area.on_draw(viewer); };

    driver.draw_frames(c_settle_frames, draw);
    driver.click(add_button_position(tab_button_rect(viewer, "a")), ui::MouseButton::Left, draw);
    driver.draw_frame(draw);

    ASSERT_GE(viewer.count("on_draw_add_popup"), 1);
    ASSERT_EQ(viewer.count("on_add"), 0);
}
