#include "TabBodyFlags.h"

#include <libtabdock/Dock/ScrollBars.h>
#include <libtabdock/UI/tabdockimgui.h>

#include <gtest/gtest.h>

using namespace tabdock;

TEST(to_body_panel_flags, body_panel_never_draws_its_own_background)
{
    for (bool horizontal : {false, true}) {
        for (bool vertical : {false, true}) {
            const TabBodyFlags flags = to_body_panel_flags(ScrollBars{horizontal, vertical});
            ASSERT_TRUE(flags.panel_flags.get(ui::PanelFlag::NoBackground));
        }
    }
}

TEST(to_body_panel_flags, both_scroll_bars_allows_scrolling_in_both_directions)
{
    const TabBodyFlags flags = to_body_panel_flags(ScrollBars{true, true});

    ASSERT_TRUE(flags.panel_flags.get(ui::PanelFlag::HorizontalScrollbar));
    ASSERT_FALSE(flags.panel_flags.get(ui::PanelFlag::NoScrollbar));
    ASSERT_FALSE(flags.panel_flags.get(ui::PanelFlag::NoScrollWithMouse));
    ASSERT_FALSE(flags.child_panel_flags.get(ui::ChildPanelFlag::AutoResizeY));
}

TEST(to_body_panel_flags, vertical_only_does_not_provision_a_horizontal_scroll_bar)
{
    const TabBodyFlags flags = to_body_panel_flags(ScrollBars{false, true});

    ASSERT_FALSE(flags.panel_flags.get(ui::PanelFlag::HorizontalScrollbar));
    ASSERT_FALSE(flags.panel_flags.get(ui::PanelFlag::NoScrollbar));
}

TEST(to_body_panel_flags, horizontal_only_grows_the_body_vertically)
{
    const TabBodyFlags flags = to_body_panel_flags(ScrollBars{true, false});

    ASSERT_TRUE(flags.panel_flags.get(ui::PanelFlag::HorizontalScrollbar));
    ASSERT_TRUE(flags.child_panel_flags.get(ui::ChildPanelFlag::AutoResizeY));
}

TEST(to_body_panel_flags, no_scroll_bars_suppresses_all_scrolling)
{
    const TabBodyFlags flags = to_body_panel_flags(ScrollBars{false, false});

    ASSERT_TRUE(flags.panel_flags.get(ui::PanelFlag::NoScrollbar));
    ASSERT_TRUE(flags.panel_flags.get(ui::PanelFlag::NoScrollWithMouse));
    ASSERT_FALSE(flags.panel_flags.get(ui::PanelFlag::HorizontalScrollbar));
}

TEST(to_body_panel_flags, default_scroll_bars_produce_the_same_flags_as_both_enabled)
{
    ASSERT_EQ(to_body_panel_flags(ScrollBars{}), to_body_panel_flags(ScrollBars{true, true}));
}
