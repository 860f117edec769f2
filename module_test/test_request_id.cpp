/*-------------------------------------------------------------------------
 *
 * test_request_id.cpp
 *      Request identifier generator tests.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "protocol/CRequestIdGenerator.hpp"

#include <gtest/gtest.h>
#include <set>
#include <vector>

namespace DocWire
{
namespace Test
{

TEST(RequestIdGeneratorTest, SameSeedSameSequence)
{
    CRequestIdGenerator a(42);
    CRequestIdGenerator b(42);

    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(a.next(), b.next());
}

TEST(RequestIdGeneratorTest, DifferentSeedsDiverge)
{
    CRequestIdGenerator a(1);
    CRequestIdGenerator b(2);
    std::vector<int32_t> sa, sb;

    for (int i = 0; i < 16; ++i)
    {
        sa.push_back(a.next());
        sb.push_back(b.next());
    }
    EXPECT_NE(sa, sb);
}

TEST(RequestIdGeneratorTest, CoversBothSigns)
{
    CRequestIdGenerator gen(7);
    bool negative = false;
    bool positive = false;
    std::set<int32_t> seen;

    for (int i = 0; i < 1000; ++i)
    {
        int32_t id = gen.next();
        negative = negative || id < 0;
        positive = positive || id > 0;
        seen.insert(id);
    }
    EXPECT_TRUE(negative);
    EXPECT_TRUE(positive);
    /* Collisions over 1000 draws from 2^32 values are very unlikely */
    EXPECT_GT(seen.size(), 990u);
}

TEST(RequestIdGeneratorTest, RandomDeviceSeeded)
{
    CRequestIdGenerator a;
    CRequestIdGenerator b;
    std::vector<int32_t> sa, sb;

    for (int i = 0; i < 8; ++i)
    {
        sa.push_back(a.next());
        sb.push_back(b.next());
    }
    EXPECT_NE(sa, sb);
}

} /* namespace Test */
} /* namespace DocWire */
