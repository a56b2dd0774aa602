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

#ifndef STRIPE_PLUGINS_LOOPBACK_TRANSPORT_H
#define STRIPE_PLUGINS_LOOPBACK_TRANSPORT_H

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <unordered_map>
#include <vector>

#include "stripe_transport.h"

/**
 * @class stripeLoopbackStore
 * @brief In-process object service shared by every loopback connection. Holds the
 *        data-center table, the authorization keys accepted by each data-center, upload
 *        sessions collecting parts by index, and published objects.
 *
 *        All methods are thread-safe.
 */
class stripeLoopbackStore {
public:
    explicit stripeLoopbackStore(const std::vector<stripe_dc_id_t> &dc_ids = {1, 2, 3});

    stripeLoopbackStore(const stripeLoopbackStore &) = delete;
    stripeLoopbackStore &
    operator=(const stripeLoopbackStore &) = delete;

    /**
     * Bootstrap authorization: mint a key accepted by dc_id, as a login would.
     */
    stripe_status_t
    authorize(stripe_dc_id_t dc_id, stripe_auth_key_t &key);

    /**
     * Assemble a finished upload into a readable object on dc_id. The parts must cover
     * 0..partCount-1 with equal sizes except a shorter last one, and the MD5 of small objects
     * must match the reference.
     * @return STRIPE_SUCCESS, STRIPE_ERR_NOT_FOUND for an unknown upload, STRIPE_ERR_MISMATCH
     *         when the parts do not add up to the reference
     */
    stripe_status_t
    publish(const stripeFileReference &ref, stripe_dc_id_t dc_id, stripeFileLocation &location);

    stripe_status_t
    getObjectSize(const stripeFileLocation &location, uint64_t &size) const;

    /**
     * Uniform random latency in [0, max] added to every part request, 0 completes as soon as
     * the executor runs the request.
     */
    void
    setLatency(std::chrono::microseconds max_latency);

    std::chrono::microseconds
    drawLatency();

    size_t
    getConnectCount() const {
        return connects_;
    }

    size_t
    getDisconnectCount() const {
        return disconnects_;
    }

    size_t
    getImportCount() const {
        return imports_;
    }

    /*** Server side of the connection requests ***/

    stripe_status_t
    getEndpoint(stripe_dc_id_t dc_id, stripeEndpoint &endpoint) const;

    bool
    isKeyValid(stripe_dc_id_t dc_id, const stripe_auth_key_t &key) const;

    stripe_status_t
    exportAuthorization(stripe_dc_id_t dc_id, stripeAuthTicket &ticket);

    stripe_status_t
    importAuthorization(stripe_dc_id_t dc_id,
                        const stripeAuthTicket &ticket,
                        stripe_auth_key_t &key);

    stripe_status_t
    savePart(stripe_file_id_t file_id,
             uint32_t part_index,
             std::optional<uint32_t> part_count,
             stripe_bytes_t data);

    stripe_status_t
    readRange(const stripeFileLocation &location,
              uint64_t offset,
              uint32_t limit,
              stripe_bytes_t &data) const;

    void
    countConnect() {
        ++connects_;
    }

    void
    countDisconnect() {
        ++disconnects_;
    }

private:
    struct uploadSession {
        bool big = false;
        uint32_t partCount = 0;
        std::map<uint32_t, stripe_bytes_t> parts;
    };

    struct storedObject {
        stripe_dc_id_t dcId = 0;
        int64_t accessHash = 0;
        stripe_bytes_t data;
    };

    struct pendingTicket {
        stripe_dc_id_t dcId = 0;
        stripe_bytes_t bytes;
    };

    stripe_bytes_t
    randomBytes(size_t len);

    mutable std::mutex lock_;
    std::mt19937_64 random_;
    std::set<stripe_dc_id_t> dcIds_;
    std::map<stripe_dc_id_t, std::set<stripe_auth_key_t>> keys_;
    std::unordered_map<int64_t, pendingTicket> tickets_;
    std::unordered_map<stripe_file_id_t, uploadSession> uploads_;
    std::unordered_map<int64_t, storedObject> objects_;
    std::chrono::microseconds maxLatency_;
    std::atomic<size_t> connects_;
    std::atomic<size_t> disconnects_;
    std::atomic<size_t> imports_;
};

/**
 * @class stripeLoopbackConnection
 * @brief Connection to one data-center of a loopback store. Part requests are served on the
 *        transport executor, after a random delay when the store has latency configured.
 */
class stripeLoopbackConnection : public iStripeConnection {
public:
    stripeLoopbackConnection(std::shared_ptr<stripeLoopbackStore> store,
                             std::shared_ptr<asio::thread_pool> executor,
                             stripe_dc_id_t dc_id,
                             bool authorized);
    ~stripeLoopbackConnection() override;

    stripe_dc_id_t
    getDcId() const override {
        return dcId_;
    }

    stripe_status_t
    exportAuthorization(stripe_dc_id_t dc_id, stripeAuthTicket &ticket) override;

    stripe_status_t
    importAuthorization(const stripeAuthTicket &ticket, stripe_auth_key_t &key) override;

    void
    saveFilePartAsync(stripe_file_id_t file_id,
                      uint32_t part_index,
                      stripe_bytes_t data,
                      save_part_callback_t callback) override;

    void
    saveBigFilePartAsync(stripe_file_id_t file_id,
                         uint32_t part_index,
                         uint32_t part_count,
                         stripe_bytes_t data,
                         save_part_callback_t callback) override;

    void
    getFilePartAsync(const stripeFileLocation &location,
                     uint64_t offset,
                     uint32_t limit,
                     get_part_callback_t callback) override;

    stripe_status_t
    disconnect() override;

private:
    stripe_status_t
    checkUsable() const;

    void
    complete(std::function<void()> work);

    std::shared_ptr<stripeLoopbackStore> store_;
    std::shared_ptr<asio::thread_pool> executor_;
    stripe_dc_id_t dcId_;
    std::atomic<bool> authorized_;
    std::atomic<bool> connected_;
};

/**
 * @class stripeLoopbackTransport
 * @brief Transport handing out connections to a loopback store.
 */
class stripeLoopbackTransport : public iStripeTransport {
public:
    explicit stripeLoopbackTransport(std::shared_ptr<stripeLoopbackStore> store);

    void
    setExecutor(std::shared_ptr<asio::thread_pool> executor) override {
        executor_ = executor;
    }

    stripe_status_t
    getEndpoint(stripe_dc_id_t dc_id, stripeEndpoint &endpoint) override;

    stripe_status_t
    connect(const stripeEndpoint &endpoint,
            const std::optional<stripe_auth_key_t> &auth_key,
            std::unique_ptr<iStripeConnection> &conn) override;

    const std::shared_ptr<stripeLoopbackStore> &
    getStore() const {
        return store_;
    }

private:
    std::shared_ptr<stripeLoopbackStore> store_;
    std::shared_ptr<asio::thread_pool> executor_;
};

#endif // STRIPE_PLUGINS_LOOPBACK_TRANSPORT_H
