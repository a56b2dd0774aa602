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
#ifndef TEST_GTEST_MOCK_TRANSPORT_H
#define TEST_GTEST_MOCK_TRANSPORT_H

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "loopback/loopback_transport.h"
#include "stripe_session.h"

namespace gtest {

/**
 * Shared record of one connection handed out by mockTransport, kept after the connection
 * itself is gone.
 */
struct connRecord {
    size_t id = 0;
    stripe_dc_id_t dcId = 0;
    std::thread::id thread;
    std::atomic<bool> disconnected{false};
    std::atomic<bool> broken{false};
    std::atomic<size_t> requests{0};
};

/**
 * Transport decorating a loopback transport. Records which connection carried every part
 * request and injects failures.
 */
class mockTransport : public iStripeTransport {
public:
    explicit mockTransport(std::shared_ptr<stripeLoopbackStore> store)
        : inner_(std::make_shared<stripeLoopbackTransport>(store)) {}

    void
    setExecutor(std::shared_ptr<asio::thread_pool> executor) override {
        inner_->setExecutor(executor);
    }

    stripe_status_t
    getEndpoint(stripe_dc_id_t dc_id, stripeEndpoint &endpoint) override {
        return inner_->getEndpoint(dc_id, endpoint);
    }

    stripe_status_t
    connect(const stripeEndpoint &endpoint,
            const std::optional<stripe_auth_key_t> &auth_key,
            std::unique_ptr<iStripeConnection> &conn) override;

    /*** Failure injection ***/

    /** The n-th connect call (0 based) fails */
    void
    failConnect(size_t n) {
        failConnectAt_ = n;
    }

    /** The n-th connect call (0 based) throws */
    void
    throwConnect(size_t n) {
        throwConnectAt_ = n;
    }

    void
    failImport(bool fail) {
        failImport_ = fail;
    }

    /** The request for this part index fails, and so does everything after it on that connection */
    void
    failPart(uint32_t part_index) {
        failPart_ = part_index;
    }

    /** The read at this offset fails */
    void
    failOffset(uint64_t offset) {
        failOffset_ = offset;
    }

    /** The read at this offset returns one byte less than stored */
    void
    truncateOffset(uint64_t offset) {
        truncateOffset_ = offset;
    }

    /*** Observations ***/

    std::vector<std::shared_ptr<connRecord>>
    getConnections() const {
        const std::lock_guard<std::mutex> lock(lock_);
        return conns_;
    }

    size_t
    getConnectCount() const {
        const std::lock_guard<std::mutex> lock(lock_);
        return conns_.size();
    }

    size_t
    getOpenCount() const {
        size_t open = 0;
        for (const auto &rec : getConnections())
            if (!rec->disconnected) ++open;
        return open;
    }

    /** Connection id that carried each part index */
    std::map<uint32_t, size_t>
    getPartRoutes() const {
        const std::lock_guard<std::mutex> lock(lock_);
        return partRoutes_;
    }

    /** Connection id that carried each read offset */
    std::map<uint64_t, size_t>
    getOffsetRoutes() const {
        const std::lock_guard<std::mutex> lock(lock_);
        return offsetRoutes_;
    }

    /** Read offsets in the order their responses arrived */
    std::vector<uint64_t>
    getCompletionOrder() const {
        const std::lock_guard<std::mutex> lock(lock_);
        return completions_;
    }

    /** Number of distinct part requests issued on a connection at the same time, maximum */
    size_t
    getMaxInFlightPerConnection() const {
        return maxInFlight_;
    }

private:
    friend class mockConnection;

    std::shared_ptr<stripeLoopbackTransport> inner_;

    mutable std::mutex lock_;
    std::vector<std::shared_ptr<connRecord>> conns_;
    std::map<uint32_t, size_t> partRoutes_;
    std::map<uint64_t, size_t> offsetRoutes_;
    std::vector<uint64_t> completions_;
    std::atomic<size_t> maxInFlight_{0};

    std::optional<size_t> failConnectAt_;
    std::optional<size_t> throwConnectAt_;
    bool failImport_ = false;
    std::optional<uint32_t> failPart_;
    std::optional<uint64_t> failOffset_;
    std::optional<uint64_t> truncateOffset_;
};

class mockConnection : public iStripeConnection {
public:
    mockConnection(mockTransport &transport,
                   std::unique_ptr<iStripeConnection> inner,
                   std::shared_ptr<connRecord> record)
        : transport_(transport),
          inner_(std::move(inner)),
          record_(std::move(record)),
          inFlight_(std::make_shared<std::atomic<size_t>>(0)) {}

    stripe_dc_id_t
    getDcId() const override {
        return inner_->getDcId();
    }

    stripe_status_t
    exportAuthorization(stripe_dc_id_t dc_id, stripeAuthTicket &ticket) override {
        return inner_->exportAuthorization(dc_id, ticket);
    }

    stripe_status_t
    importAuthorization(const stripeAuthTicket &ticket, stripe_auth_key_t &key) override {
        if (transport_.failImport_) return STRIPE_ERR_NOT_ALLOWED;
        return inner_->importAuthorization(ticket, key);
    }

    void
    saveFilePartAsync(stripe_file_id_t file_id,
                      uint32_t part_index,
                      stripe_bytes_t data,
                      save_part_callback_t callback) override {
        inner_->saveFilePartAsync(
            file_id, part_index, std::move(data), wrapSave(part_index, std::move(callback)));
    }

    void
    saveBigFilePartAsync(stripe_file_id_t file_id,
                         uint32_t part_index,
                         uint32_t part_count,
                         stripe_bytes_t data,
                         save_part_callback_t callback) override {
        inner_->saveBigFilePartAsync(file_id,
                                     part_index,
                                     part_count,
                                     std::move(data),
                                     wrapSave(part_index, std::move(callback)));
    }

    void
    getFilePartAsync(const stripeFileLocation &location,
                     uint64_t offset,
                     uint32_t limit,
                     get_part_callback_t callback) override {
        {
            const std::lock_guard<std::mutex> lock(transport_.lock_);
            transport_.offsetRoutes_[offset] = record_->id;
        }
        ++record_->requests;
        trackInFlight();

        const bool fail = transport_.failOffset_ == offset;
        const bool truncate = transport_.truncateOffset_ == offset;
        auto record = record_;
        auto in_flight = inFlight_;
        mockTransport *transport = &transport_;
        inner_->getFilePartAsync(
            location,
            offset,
            limit,
            [transport, record, in_flight, offset, fail, truncate, callback](stripe_status_t status,
                                                                            stripe_bytes_t data) {
                --*in_flight;
                {
                    const std::lock_guard<std::mutex> lock(transport->lock_);
                    transport->completions_.push_back(offset);
                }
                if (fail || record->broken) {
                    record->broken = true;
                    callback(STRIPE_ERR_UNKNOWN, {});
                    return;
                }
                if (truncate && !data.empty()) data.pop_back();
                callback(status, std::move(data));
            });
    }

    stripe_status_t
    disconnect() override {
        record_->disconnected = true;
        return inner_->disconnect();
    }

private:
    void
    trackInFlight() {
        const size_t now = ++*inFlight_;
        size_t seen = transport_.maxInFlight_;
        while (now > seen && !transport_.maxInFlight_.compare_exchange_weak(seen, now)) {}
    }

    save_part_callback_t
    wrapSave(uint32_t part_index, save_part_callback_t callback) {
        {
            const std::lock_guard<std::mutex> lock(transport_.lock_);
            transport_.partRoutes_[part_index] = record_->id;
        }
        ++record_->requests;
        trackInFlight();

        const bool fail = transport_.failPart_ == part_index;
        auto record = record_;
        auto in_flight = inFlight_;
        return [record, in_flight, fail, callback](stripe_status_t status) {
            --*in_flight;
            if (fail || record->broken) {
                record->broken = true;
                callback(STRIPE_ERR_UNKNOWN);
                return;
            }
            callback(status);
        };
    }

    mockTransport &transport_;
    std::unique_ptr<iStripeConnection> inner_;
    std::shared_ptr<connRecord> record_;
    std::shared_ptr<std::atomic<size_t>> inFlight_;
};

inline stripe_status_t
mockTransport::connect(const stripeEndpoint &endpoint,
                       const std::optional<stripe_auth_key_t> &auth_key,
                       std::unique_ptr<iStripeConnection> &conn) {
    std::shared_ptr<connRecord> record;
    {
        const std::lock_guard<std::mutex> lock(lock_);
        const size_t n = conns_.size();
        if (failConnectAt_ == n) {
            failConnectAt_.reset();
            return STRIPE_ERR_NOT_ALLOWED;
        }
        if (throwConnectAt_ == n) {
            throwConnectAt_.reset();
            throw std::runtime_error("connection refused");
        }
        record = std::make_shared<connRecord>();
        record->id = n;
        record->dcId = endpoint.dcId;
        record->thread = std::this_thread::get_id();
        conns_.push_back(record);
    }

    std::unique_ptr<iStripeConnection> inner;
    const stripe_status_t status = inner_->connect(endpoint, auth_key, inner);
    if (status != STRIPE_SUCCESS) {
        record->disconnected = true;
        return status;
    }

    conn = std::make_unique<mockConnection>(*this, std::move(inner), record);
    return STRIPE_SUCCESS;
}

/**
 * Fixture owning a loopback store with data-centers 1, 2 and 3, a mock transport on top of it
 * and a session whose primary connection lives on data-center 1.
 */
class loopbackFixture : public testing::Test {
protected:
    static constexpr stripe_dc_id_t homeDc = 1;

    void
    SetUp() override {
        store_ = std::make_shared<stripeLoopbackStore>();
        transport_ = std::make_shared<mockTransport>(store_);
        session_ = makeSession();
    }

    void
    TearDown() override {
        session_.reset();
        if (primary_) primary_->disconnect();
    }

    std::shared_ptr<stripeSession>
    makeSession(size_t num_threads = 4) {
        stripe_auth_key_t key;
        EXPECT_EQ(store_->authorize(homeDc, key), STRIPE_SUCCESS);

        // The primary comes straight from the store so it does not show up in the records
        stripeLoopbackTransport direct(store_);
        stripeEndpoint endpoint;
        EXPECT_EQ(direct.getEndpoint(homeDc, endpoint), STRIPE_SUCCESS);
        std::unique_ptr<iStripeConnection> primary;
        EXPECT_EQ(direct.connect(endpoint, key, primary), STRIPE_SUCCESS);
        primary_ = std::shared_ptr<iStripeConnection>(std::move(primary));

        return std::make_shared<stripeSession>(transport_, primary_, key, num_threads);
    }

    std::shared_ptr<stripeLoopbackStore> store_;
    std::shared_ptr<mockTransport> transport_;
    std::shared_ptr<iStripeConnection> primary_;
    std::shared_ptr<stripeSession> session_;
};

} // namespace gtest

#endif /* TEST_GTEST_MOCK_TRANSPORT_H */
