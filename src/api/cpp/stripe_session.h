/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef _STRIPE_SESSION_H
#define _STRIPE_SESSION_H

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <asio.hpp>
#include "stripe_transport.h"

/**
 * @class stripeSession
 * @brief Pre-authenticated primary session. Owns the executor shared by all transfers
 *        and the per data-center authorization cache, which lives as long as the session.
 */
class stripeSession {
public:
    /**
     * @param transport Transport used to open every connection
     * @param primary Authenticated primary connection to the home data-center
     * @param auth_key Authorization key of the home data-center
     * @param num_threads Executor size, 0 selects half the hardware threads
     */
    stripeSession(std::shared_ptr<iStripeTransport> transport,
                  std::shared_ptr<iStripeConnection> primary,
                  stripe_auth_key_t auth_key,
                  size_t num_threads = 0);
    ~stripeSession();

    stripeSession(const stripeSession &) = delete;
    stripeSession &
    operator=(const stripeSession &) = delete;

    stripe_dc_id_t
    getHomeDcId() const {
        return homeDcId_;
    }

    iStripeTransport &
    getTransport() const {
        return *transport_;
    }

    iStripeConnection &
    getPrimary() const {
        return *primary_;
    }

    /**
     * Executor running transport completions and connection setup.
     */
    asio::thread_pool &
    getExecutor() const {
        return *executor_;
    }

    const stripe_auth_key_t &
    getAuthKey() const {
        return authKey_;
    }

    /**
     * Authorization usable on dc_id: the session key for the home data-center,
     * a previously imported key otherwise, or nullopt when none is known yet.
     */
    std::optional<stripe_auth_key_t>
    getAuthorization(stripe_dc_id_t dc_id) const;

    void
    cacheAuthorization(stripe_dc_id_t dc_id, const stripe_auth_key_t &key);

private:
    std::shared_ptr<asio::thread_pool> executor_;
    std::shared_ptr<iStripeTransport> transport_;
    std::shared_ptr<iStripeConnection> primary_;
    stripe_auth_key_t authKey_;
    stripe_dc_id_t homeDcId_;

    mutable std::mutex authLock_;
    std::unordered_map<stripe_dc_id_t, stripe_auth_key_t> authCache_;
};

#endif
