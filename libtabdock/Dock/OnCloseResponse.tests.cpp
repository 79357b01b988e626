#include "OnCloseResponse.h"

#include <gtest/gtest.h>

#include <sstream>

using namespace tabdock;

TEST(OnCloseResponse, can_be_printed)
{
    std::stringstream ss;
    ss << OnCloseResponse::Close << ' ' << OnCloseResponse::Focus << ' ' << OnCloseResponse::Ignore;
    ASSERT_EQ(ss.str(), "Close Focus Ignore");
}

TEST(OnCloseResponse, to_cstringview_returns_the_enumerator_name)
{
    ASSERT_EQ(to_cstringview(OnCloseResponse::Ignore), "Ignore");
}
