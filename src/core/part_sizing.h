/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef STRIPE_CORE_PART_SIZING_H
#define STRIPE_CORE_PART_SIZING_H

#include <optional>
#include "stripe_types.h"

namespace stripe {

inline constexpr uint64_t KiB = 1024;
inline constexpr uint64_t MiB = 1024 * KiB;

// Objects above this size use the checksum-free part upload variant
inline constexpr uint64_t largeObjectThreshold = 10 * MiB;
// Objects of at least this size get the full connection count
inline constexpr uint64_t fullSizeReference = 100 * MiB;
inline constexpr uint64_t maxPartSize = 512 * KiB;

inline constexpr uint16_t minConnections = 1;
inline constexpr uint16_t maxConnections = 20;
inline constexpr uint16_t defaultConnections = 20;

} // namespace stripe

/**
 * Optional caller overrides of the computed plan.
 */
struct stripePlanOverrides {
    /** @var Part size in KiB, must divide 512 KiB evenly */
    std::optional<uint32_t> partSizeKb;
    /** @var Connection count, 1..max_connections */
    std::optional<uint16_t> connectionCount;
};

namespace stripe {

/**
 * Part size the remote service accepts for an object of total_size bytes.
 */
uint32_t
appropriatePartSize(uint64_t total_size);

/**
 * Connection count for an object of total_size bytes: max_connections from the full-size
 * reference upwards, proportionally fewer (at least one) below it.
 */
uint16_t
connectionCount(uint64_t total_size, uint16_t max_connections);

/**
 * Compute the transfer plan of an object.
 *
 * @param total_size       Object size in bytes
 * @param max_connections  Connection limit, 1..20
 * @param plan       [out] Resulting plan
 * @param overrides        Optional part size / connection count overrides
 * @return STRIPE_SUCCESS or STRIPE_ERR_INVALID_PARAM
 */
stripe_status_t
makePlan(uint64_t total_size,
         uint16_t max_connections,
         stripeTransferPlan &plan,
         const stripePlanOverrides &overrides = {});

} // namespace stripe

#endif // STRIPE_CORE_PART_SIZING_H
