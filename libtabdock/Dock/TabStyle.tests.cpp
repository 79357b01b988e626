#include "TabStyle.h"

#include <libtabdock/Graphics/Color.h>

#include <gtest/gtest.h>

#include <sstream>

using namespace tabdock;

TEST(TabStyle, default_text_color_is_white)
{
    ASSERT_EQ(TabStyle{}.text_color, Color::white());
}

TEST(TabStyle, default_fills_distinguish_the_tab_states)
{
    const TabStyle style;
    ASSERT_NE(style.bg_fill, style.bg_fill_hovered);
    ASSERT_NE(style.bg_fill, style.bg_fill_active);
    ASSERT_NE(style.bg_fill_hovered, style.bg_fill_active);
}

TEST(TabStyle, compares_every_member)
{
    TabStyle lhs;
    TabStyle rhs;
    ASSERT_EQ(lhs, rhs);

    rhs.rounding = 0.0f;
    ASSERT_NE(lhs, rhs);

    rhs = lhs;
    rhs.body_bg_fill = Color::white();
    ASSERT_NE(lhs, rhs);
}

TEST(TabStyle, can_be_printed)
{
    std::stringstream ss;
    ss << TabStyle{};
    ASSERT_TRUE(ss.str().starts_with("TabStyle(rounding = 4"));
}
