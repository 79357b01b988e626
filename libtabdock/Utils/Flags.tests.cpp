#include "Flags.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <unordered_set>

using namespace tabdock;

namespace
{
    enum class PanelOption : uint8_t {
        None       = 0,
        Closeable  = 1<<0,
        Scrollable = 1<<1,
        Titled     = 1<<2,
    };
    using PanelOptions = Flags<PanelOption>;
}

TEST(Flags, default_constructed_has_no_flags_set)
{
    const PanelOptions options;
    ASSERT_EQ(options, PanelOption::None);
    ASSERT_FALSE(options);
    ASSERT_TRUE(!options);
}

TEST(Flags, can_be_built_from_an_initializer_list)
{
    const PanelOptions options = {PanelOption::Closeable, PanelOption::Titled};
    ASSERT_TRUE(options.get(PanelOption::Closeable));
    ASSERT_FALSE(options.get(PanelOption::Scrollable));
    ASSERT_TRUE(options.get(PanelOption::Titled));
}

TEST(Flags, with_and_without_toggle_a_single_flag)
{
    const PanelOptions options = PanelOptions{}.with(PanelOption::Scrollable);
    ASSERT_TRUE(options.get(PanelOption::Scrollable));
    ASSERT_FALSE(options.without(PanelOption::Scrollable).get(PanelOption::Scrollable));
}

TEST(Flags, or_assign_accumulates_flags)
{
    PanelOptions options = PanelOption::Closeable;
    options |= PanelOption::Titled;
    ASSERT_EQ(options, (PanelOptions{PanelOption::Closeable, PanelOption::Titled}));
    ASSERT_EQ(options.underlying_value(), 0b101);
}

TEST(Flags, and_returns_intersection)
{
    const PanelOptions lhs = {PanelOption::Closeable, PanelOption::Scrollable};
    const PanelOptions rhs = {PanelOption::Scrollable, PanelOption::Titled};
    ASSERT_EQ(lhs & rhs, PanelOption::Scrollable);
}

TEST(Flags, equal_flags_hash_equally)
{
    const std::unordered_set<PanelOptions> set = {
        PanelOptions{PanelOption::Closeable, PanelOption::Titled},
        PanelOptions{PanelOption::Titled, PanelOption::Closeable},
    };
    ASSERT_EQ(set.size(), 1);
}
