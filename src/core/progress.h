/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef STRIPE_CORE_PROGRESS_H
#define STRIPE_CORE_PROGRESS_H

#include <chrono>
#include "stripe_types.h"

/**
 * @class stripeProgressTracker
 * @brief Accumulates transferred bytes and forwards them to a caller callback, at most once per
 *        interval. The final notification at completion is always delivered, exactly once.
 *        Used only by the orchestrating thread of a transfer.
 */
class stripeProgressTracker {
public:
    using clock_t = std::chrono::steady_clock;

    stripeProgressTracker(stripe_progress_cb_t callback,
                          uint64_t total,
                          std::chrono::milliseconds interval = std::chrono::milliseconds(0));

    /**
     * Account bytes more, notifying when the interval has elapsed. Reaching the total does not
     * notify, completion is left to finish().
     */
    void
    add(uint64_t bytes);

    /**
     * Deliver the completion notification unless it was already sent.
     */
    void
    finish();

    uint64_t
    getTransferred() const {
        return transferred_;
    }

    uint64_t
    getTotal() const {
        return total_;
    }

private:
    void
    notify(clock_t::time_point now);

    stripe_progress_cb_t callback_;
    uint64_t total_;
    uint64_t transferred_;
    std::chrono::milliseconds interval_;
    clock_t::time_point lastNotify_;
    bool notified_;
    bool finished_;
};

#endif // STRIPE_CORE_PROGRESS_H
