#include <folio/Utils/UID.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <unordered_set>

using folio::UID;

TEST(UID, DefaultConstructedUIDsAreUniqueAndValid)
{
    UID const a;
    UID const b;

    ASSERT_NE(a, b);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    ASSERT_LT(a, b);
}

TEST(UID, EmptyAndInvalidUIDsAreFalsey)
{
    ASSERT_FALSE(UID::empty());
    ASSERT_FALSE(UID::invalid());
    ASSERT_NE(UID::empty(), UID::invalid());
}

TEST(UID, ResetAllocatesANewID)
{
    UID id;
    UID const copy = id;

    id.reset();

    ASSERT_NE(id, copy);
}

TEST(UID, CanBeUsedAsAHashKey)
{
    UID const a;
    UID const b;
    std::unordered_set<UID> const s{a, b, a};

    ASSERT_EQ(s.size(), 2);
}

TEST(UID, StreamsAsItsNumericValue)
{
    UID const id;
    std::stringstream ss;
    ss << id;

    ASSERT_EQ(ss.str(), std::to_string(id.get()));
}
