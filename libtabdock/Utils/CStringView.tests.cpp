#include "CStringView.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <string_view>

using namespace tabdock;

TEST(CStringView, default_constructed_is_an_empty_nul_terminated_string)
{
    const CStringView sv;
    ASSERT_TRUE(sv.empty());
    ASSERT_EQ(sv.size(), 0);
    ASSERT_NE(sv.c_str(), nullptr);
    ASSERT_EQ(sv.c_str()[0], '\0');
}

TEST(CStringView, null_pointer_is_treated_as_an_empty_string)
{
    const char* p = nullptr;
    const CStringView sv{p};
    ASSERT_TRUE(sv.empty());
    ASSERT_NE(sv.c_str(), nullptr);
}

TEST(CStringView, views_a_std_string_without_copying)
{
    const std::string title = "Scene###tab";
    const CStringView sv{title};
    ASSERT_EQ(sv.c_str(), title.c_str());
    ASSERT_EQ(sv.size(), title.size());
}

TEST(CStringView, compares_by_content)
{
    const std::string a = "tab";
    ASSERT_EQ(CStringView{a}, CStringView{"tab"});
    ASSERT_NE(CStringView{"tab"}, CStringView{"tabs"});
}

TEST(CStringView, can_be_concatenated_onto_strings)
{
    ASSERT_EQ("##" + CStringView{"body"}, "##body");
    ASSERT_EQ(std::string{"##"} + CStringView{"tabs"}, "##tabs");
}

TEST(CStringView, can_be_printed)
{
    std::stringstream ss;
    ss << CStringView{"Inspector"};
    ASSERT_EQ(ss.str(), "Inspector");
}
