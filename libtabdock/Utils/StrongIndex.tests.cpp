#include "StrongIndex.h"

#include <gtest/gtest.h>

#include <sstream>
#include <type_traits>
#include <unordered_set>

using namespace tabdock;

namespace
{
    struct AppleTag;
    struct OrangeTag;
    using AppleIndex = StrongIndex<AppleTag>;
    using OrangeIndex = StrongIndex<OrangeTag>;
}

TEST(StrongIndex, default_constructs_to_zero)
{
    ASSERT_EQ(AppleIndex{}.get(), 0);
}

TEST(StrongIndex, indices_with_different_tags_are_different_types)
{
    static_assert(not std::is_same_v<AppleIndex, OrangeIndex>);
    static_assert(not std::is_convertible_v<AppleIndex, OrangeIndex>);
    static_assert(not std::is_convertible_v<size_t, AppleIndex>);
}

TEST(StrongIndex, compares_by_value)
{
    ASSERT_EQ(AppleIndex{3}, AppleIndex{3});
    ASSERT_NE(AppleIndex{3}, AppleIndex{4});
    ASSERT_LT(AppleIndex{1}, AppleIndex{2});
}

TEST(StrongIndex, can_be_used_as_hash_key)
{
    const std::unordered_set<AppleIndex> indices = {AppleIndex{1}, AppleIndex{2}, AppleIndex{1}};
    ASSERT_EQ(indices.size(), 2);
}

TEST(StrongIndex, writes_its_value_to_a_stream)
{
    std::stringstream ss;
    ss << AppleIndex{42};
    ASSERT_EQ(ss.str(), "42");
}
