/*-------------------------------------------------------------------------
 *
 * CRequestIdGenerator.cpp
 *      Per-connection stream of pseudo-random request identifiers.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "protocol/CRequestIdGenerator.hpp"

#include <limits>

namespace DocWire
{

static uint64_t entropySeed()
{
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

CRequestIdGenerator::CRequestIdGenerator()
    : CRequestIdGenerator(entropySeed())
{
}

CRequestIdGenerator::CRequestIdGenerator(uint64_t seed)
    : engine_(seed),
      distribution_(std::numeric_limits<int32_t>::min(),
                    std::numeric_limits<int32_t>::max())
{
}

int32_t CRequestIdGenerator::next()
{
    return distribution_(engine_);
}

} /* namespace DocWire */
