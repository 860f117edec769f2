/*-------------------------------------------------------------------------
 *
 * CRequestIdGenerator.hpp
 *      Per-connection stream of pseudo-random request identifiers.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <random>

namespace DocWire
{

/**
 * Uniform over the full signed 32-bit range. Identifiers only correlate
 * replies with requests; they are not unique and not a security token.
 * Not thread-safe: owned and advanced by a single send path.
 */
class CRequestIdGenerator
{
  public:
    /* Seeded once from std::random_device */
    CRequestIdGenerator();

    /* Deterministic sequence, for tests and replay */
    explicit CRequestIdGenerator(uint64_t seed);

    int32_t next();

  private:
    std::mt19937_64 engine_;
    std::uniform_int_distribution<int32_t> distribution_;
};

} /* namespace DocWire */
