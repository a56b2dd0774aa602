/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "progress.h"

stripeProgressTracker::stripeProgressTracker(stripe_progress_cb_t callback,
                                             uint64_t total,
                                             std::chrono::milliseconds interval)
    : callback_(std::move(callback)),
      total_(total),
      transferred_(0),
      interval_(interval),
      notified_(false),
      finished_(false) {}

void
stripeProgressTracker::add(uint64_t bytes) {
    transferred_ += bytes;
    if (!callback_ || finished_) return;

    // Completion is reported by finish() once the transfer has succeeded
    if (transferred_ >= total_) return;

    const auto now = clock_t::now();
    if (!notified_ || now - lastNotify_ >= interval_) notify(now);
}

void
stripeProgressTracker::finish() {
    if (finished_) return;
    finished_ = true;
    transferred_ = total_;
    if (callback_) notify(clock_t::now());
}

void
stripeProgressTracker::notify(clock_t::time_point now) {
    lastNotify_ = now;
    notified_ = true;
    callback_(transferred_, total_);
}
