/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stripe_session.h"
#include "common/configuration.h"
#include "common/stripe_log.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace {

constexpr size_t maxThreads = 256;

size_t
getNumThreads(size_t requested) {
    if (requested > 0) return requested;
    const size_t fallback = std::max(1u, std::thread::hardware_concurrency() / 2);
    return stripe::config::getValueInRange<size_t>(
        stripe::config::numThreadsVar, fallback, 1, maxThreads);
}

} // namespace

stripeSession::stripeSession(std::shared_ptr<iStripeTransport> transport,
                             std::shared_ptr<iStripeConnection> primary,
                             stripe_auth_key_t auth_key,
                             size_t num_threads)
    : transport_(std::move(transport)),
      primary_(std::move(primary)),
      authKey_(std::move(auth_key)) {
    stripeLogInit();

    if (!transport_) throw std::invalid_argument("Session needs a transport");
    if (!primary_) throw std::invalid_argument("Session needs a primary connection");

    homeDcId_ = primary_->getDcId();
    executor_ = std::make_shared<asio::thread_pool>(getNumThreads(num_threads));
    transport_->setExecutor(executor_);

    STRIPE_INFO << "Session initialized on home data-center " << homeDcId_;
}

stripeSession::~stripeSession() {
    executor_->wait();
}

std::optional<stripe_auth_key_t>
stripeSession::getAuthorization(stripe_dc_id_t dc_id) const {
    if (dc_id == homeDcId_) return authKey_;

    const std::lock_guard<std::mutex> lock(authLock_);
    auto it = authCache_.find(dc_id);
    if (it == authCache_.end()) return std::nullopt;
    return it->second;
}

void
stripeSession::cacheAuthorization(stripe_dc_id_t dc_id, const stripe_auth_key_t &key) {
    const std::lock_guard<std::mutex> lock(authLock_);
    authCache_[dc_id] = key;
    STRIPE_DEBUG << "Cached authorization for data-center " << dc_id;
}
