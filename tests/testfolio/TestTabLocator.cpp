#include <folio/UI/TabLocator.hpp>

#include "TestingHelpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using folio::TabID;
using folio::TabLocator;
using folio::TestWidget;

TEST(TabLocator, OnlyEndOfTabsIsEnd)
{
    TestWidget w{"w"};

    ASSERT_TRUE(TabLocator{folio::c_EndOfTabs}.isEnd());
    ASSERT_FALSE(TabLocator{TabID{}}.isEnd());
    ASSERT_FALSE(TabLocator{w}.isEnd());
    ASSERT_FALSE(TabLocator{"name"}.isEnd());
}

TEST(TabLocator, ToStringDescribesTheLocator)
{
    TestWidget w{"editor"};

    ASSERT_EQ(TabLocator{folio::c_EndOfTabs}.toString(), "end");
    ASSERT_EQ(TabLocator{std::string_view{"x.py"}}.toString(), "name 'x.py'");
    ASSERT_NE(TabLocator{w}.toString().find("editor"), std::string::npos);

    TabID const id;
    ASSERT_EQ(TabLocator{id}.toString(), "tab #" + std::to_string(id.get()));
}
