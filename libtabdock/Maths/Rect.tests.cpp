#include "Rect.h"

#include <gtest/gtest.h>

#include <sstream>

using namespace tabdock;

TEST(Rect, from_corners_is_independent_of_corner_order)
{
    ASSERT_EQ(Rect::from_corners({10.0f, 20.0f}, {0.0f, 5.0f}), Rect::from_corners({0.0f, 5.0f}, {10.0f, 20.0f}));
}

TEST(Rect, from_top_left_and_dimensions_has_expected_extents)
{
    const Rect rect = Rect::from_top_left_and_dimensions({5.0f, 10.0f}, {100.0f, 50.0f});

    ASSERT_EQ(rect.min_corner(), Vec2(5.0f, 10.0f));
    ASSERT_EQ(rect.max_corner(), Vec2(105.0f, 60.0f));
    ASSERT_EQ(rect.width(), 100.0f);
    ASSERT_EQ(rect.height(), 50.0f);
    ASSERT_EQ(rect.dimensions(), Vec2(100.0f, 50.0f));
}

TEST(Rect, origin_is_the_center_of_the_rect)
{
    const Rect rect = Rect::from_top_left_and_dimensions({10.0f, 20.0f}, {30.0f, 40.0f});
    ASSERT_EQ(rect.origin(), (Vec2{25.0f, 40.0f}));
    ASSERT_TRUE(rect.contains(rect.origin()));
}

TEST(Rect, contains_includes_edges)
{
    const Rect rect = Rect::from_corners({0.0f, 0.0f}, {10.0f, 10.0f});

    ASSERT_TRUE(rect.contains({0.0f, 0.0f}));
    ASSERT_TRUE(rect.contains({10.0f, 5.0f}));
    ASSERT_FALSE(rect.contains({10.5f, 5.0f}));
}

TEST(Rect, rects_that_differ_in_position_only_are_not_equal)
{
    const Rect a = Rect::from_top_left_and_dimensions({0.0f, 0.0f}, {10.0f, 10.0f});
    const Rect b = Rect::from_top_left_and_dimensions({1.0f, 0.0f}, {10.0f, 10.0f});

    ASSERT_NE(a, b);
}

TEST(Rect, can_be_printed)
{
    std::stringstream ss;
    ss << Rect::from_corners({0.0f, 0.0f}, {1.0f, 2.0f});
    ASSERT_EQ(ss.str(), "Rect(min = Vec2(0, 0), max = Vec2(1, 2))");
}
