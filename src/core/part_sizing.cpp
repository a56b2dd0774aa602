/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "part_sizing.h"
#include "common/stripe_log.h"

#include <absl/strings/str_format.h>
#include <algorithm>

namespace stripe {

uint32_t
appropriatePartSize(uint64_t total_size) {
    if (total_size <= 100 * MiB) return 128 * KiB;
    if (total_size <= 750 * MiB) return 256 * KiB;
    return 512 * KiB;
}

uint16_t
connectionCount(uint64_t total_size, uint16_t max_connections) {
    if (total_size > fullSizeReference) return max_connections;

    // ceil(total_size / full_size * max_connections) in integer arithmetic
    const uint64_t scaled =
        (total_size * max_connections + fullSizeReference - 1) / fullSizeReference;
    return static_cast<uint16_t>(
        std::clamp<uint64_t>(scaled, minConnections, max_connections));
}

stripe_status_t
makePlan(uint64_t total_size,
         uint16_t max_connections,
         stripeTransferPlan &plan,
         const stripePlanOverrides &overrides) {
    if (max_connections < minConnections || max_connections > maxConnections) {
        STRIPE_ERROR_FUNC << absl::StrFormat("max connections must be within [%d, %d], got %d",
                                             minConnections,
                                             maxConnections,
                                             max_connections);
        return STRIPE_ERR_INVALID_PARAM;
    }

    uint32_t part_size = appropriatePartSize(total_size);
    if (overrides.partSizeKb) {
        const uint64_t bytes = uint64_t(*overrides.partSizeKb) * KiB;
        if (bytes == 0 || bytes > maxPartSize || maxPartSize % bytes != 0) {
            STRIPE_ERROR_FUNC << "part size of " << *overrides.partSizeKb
                              << " KiB is not accepted by the remote service";
            return STRIPE_ERR_INVALID_PARAM;
        }
        part_size = static_cast<uint32_t>(bytes);
    }

    uint16_t connection_count = connectionCount(total_size, max_connections);
    if (overrides.connectionCount) {
        if (*overrides.connectionCount < minConnections ||
            *overrides.connectionCount > max_connections) {
            STRIPE_ERROR_FUNC << "connection count " << *overrides.connectionCount
                              << " exceeds the limit of " << max_connections;
            return STRIPE_ERR_INVALID_PARAM;
        }
        connection_count = *overrides.connectionCount;
    }

    plan.totalSize = total_size;
    plan.partSize = part_size;
    plan.partCount = static_cast<uint32_t>((total_size + part_size - 1) / part_size);
    plan.connectionCount = connection_count;
    plan.isLargeObject = total_size > largeObjectThreshold;

    STRIPE_DEBUG << absl::StrFormat("Plan for %d bytes: %d parts of %d bytes over %d connections%s",
                                    plan.totalSize,
                                    plan.partCount,
                                    plan.partSize,
                                    plan.connectionCount,
                                    plan.isLargeObject ? " (large object)" : "");
    return STRIPE_SUCCESS;
}

} // namespace stripe
