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

#include "auth_broker.h"
#include "common.h"
#include "mock_transport.h"
#include "gtest/gtest.h"

#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace gtest {

class authBrokerTest : public loopbackFixture {
protected:
    void
    disconnectAll(std::vector<std::unique_ptr<iStripeConnection>> &conns) {
        for (auto &conn : conns)
            stripeDisconnectQuietly(*conn);
        conns.clear();
    }
};

TEST_F(authBrokerTest, HomeDcUsesSessionAuthorization) {
    const stripeAuthBroker broker(session_);
    EXPECT_EQ(broker.getDcId(), homeDc);

    std::vector<std::unique_ptr<iStripeConnection>> conns;
    ASSERT_EQ(broker.createConnections(4, conns), STRIPE_SUCCESS);
    ASSERT_EQ(conns.size(), 4u);
    for (const auto &conn : conns)
        EXPECT_EQ(conn->getDcId(), homeDc);

    EXPECT_EQ(store_->getImportCount(), 0u);
    EXPECT_EQ(transport_->getConnectCount(), 4u);

    disconnectAll(conns);
    EXPECT_EQ(transport_->getOpenCount(), 0u);
}

TEST_F(authBrokerTest, ForeignDcImportsOnce) {
    EXPECT_FALSE(session_->getAuthorization(2).has_value());

    std::vector<std::unique_ptr<iStripeConnection>> conns;
    {
        const stripeAuthBroker broker(session_, 2);
        ASSERT_EQ(broker.createConnections(5, conns), STRIPE_SUCCESS);
    }
    ASSERT_EQ(conns.size(), 5u);
    for (const auto &conn : conns)
        EXPECT_EQ(conn->getDcId(), 2);

    // The first connection imports, the others reuse the cached key
    EXPECT_EQ(store_->getImportCount(), 1u);
    EXPECT_TRUE(session_->getAuthorization(2).has_value());
    disconnectAll(conns);

    {
        const stripeAuthBroker broker(session_, 2);
        ASSERT_EQ(broker.createConnections(3, conns), STRIPE_SUCCESS);
    }
    EXPECT_EQ(store_->getImportCount(), 1u);
    disconnectAll(conns);

    {
        const stripeAuthBroker broker(session_, 3);
        ASSERT_EQ(broker.createConnections(2, conns), STRIPE_SUCCESS);
    }
    EXPECT_EQ(store_->getImportCount(), 2u);
    disconnectAll(conns);

    EXPECT_EQ(transport_->getOpenCount(), 0u);
}

TEST_F(authBrokerTest, ConnectFailureClosesEverything) {
    const LogIgnoreGuard lig_connect("connect to data-center");
    const LogIgnoreGuard lig_open("Failed to open");

    transport_->failConnect(3);

    std::vector<std::unique_ptr<iStripeConnection>> conns;
    const stripeAuthBroker broker(session_);
    EXPECT_EQ(broker.createConnections(6, conns), STRIPE_ERR_SETUP);
    EXPECT_TRUE(conns.empty());

    EXPECT_EQ(transport_->getConnectCount(), 5u);
    EXPECT_EQ(transport_->getOpenCount(), 0u);
    EXPECT_EQ(lig_connect.getIgnoredCount(), 1u);
}

TEST_F(authBrokerTest, ConcurrentConnectionsUseSessionExecutor) {
    std::vector<std::unique_ptr<iStripeConnection>> conns;
    const stripeAuthBroker broker(session_, 2);
    ASSERT_EQ(broker.createConnections(6, conns), STRIPE_SUCCESS);
    EXPECT_EQ(store_->getImportCount(), 1u);

    const auto records = transport_->getConnections();
    ASSERT_EQ(records.size(), 6u);
    // Only the first connection is opened on the calling thread
    EXPECT_EQ(records[0]->thread, std::this_thread::get_id());
    for (size_t i = 1; i < records.size(); ++i)
        EXPECT_NE(records[i]->thread, std::this_thread::get_id()) << i;

    disconnectAll(conns);
    EXPECT_EQ(transport_->getOpenCount(), 0u);
}

TEST_F(authBrokerTest, ThrowingConnectClosesEverything) {
    const LogIgnoreGuard lig_connect("failed: connection refused");
    const LogIgnoreGuard lig_open("Failed to open");

    transport_->throwConnect(2);

    std::vector<std::unique_ptr<iStripeConnection>> conns;
    const stripeAuthBroker broker(session_);
    EXPECT_EQ(broker.createConnections(5, conns), STRIPE_ERR_SETUP);
    EXPECT_TRUE(conns.empty());

    EXPECT_EQ(transport_->getConnectCount(), 4u);
    EXPECT_EQ(transport_->getOpenCount(), 0u);
    EXPECT_EQ(lig_connect.getIgnoredCount(), 1u);
}

TEST_F(authBrokerTest, ImportFailureClosesEverything) {
    const LogIgnoreGuard lig_import("authorization import");
    const LogIgnoreGuard lig_open("Failed to open");

    transport_->failImport(true);

    std::vector<std::unique_ptr<iStripeConnection>> conns;
    const stripeAuthBroker broker(session_, 3);
    EXPECT_EQ(broker.createConnections(4, conns), STRIPE_ERR_SETUP);
    EXPECT_TRUE(conns.empty());
    EXPECT_EQ(transport_->getOpenCount(), 0u);
    EXPECT_FALSE(session_->getAuthorization(3).has_value());
}

TEST_F(authBrokerTest, UnknownDc) {
    const LogIgnoreGuard lig("no endpoint");

    std::vector<std::unique_ptr<iStripeConnection>> conns;
    const stripeAuthBroker broker(session_, 42);
    EXPECT_EQ(broker.createConnections(2, conns), STRIPE_ERR_SETUP);
    EXPECT_EQ(transport_->getConnectCount(), 0u);
}

TEST_F(authBrokerTest, RejectedAuthorization) {
    const LogIgnoreGuard lig_key("Authorization key rejected");
    const LogIgnoreGuard lig_connect("connect to data-center");
    const LogIgnoreGuard lig_open("Failed to open");

    // A key no data-center knows
    session_->cacheAuthorization(2, stripe_auth_key_t(16, 0xab));

    std::vector<std::unique_ptr<iStripeConnection>> conns;
    const stripeAuthBroker broker(session_, 2);
    EXPECT_EQ(broker.createConnections(3, conns), STRIPE_ERR_SETUP);
    EXPECT_EQ(transport_->getOpenCount(), 0u);
}

TEST_F(authBrokerTest, SessionBasics) {
    EXPECT_EQ(session_->getHomeDcId(), homeDc);
    ASSERT_TRUE(session_->getAuthorization(homeDc).has_value());
    EXPECT_EQ(*session_->getAuthorization(homeDc), session_->getAuthKey());
    EXPECT_EQ(&session_->getPrimary(), primary_.get());

    EXPECT_THROW((void)stripeSession(nullptr, primary_, {}), std::invalid_argument);
    EXPECT_THROW((void)stripeSession(transport_, nullptr, {}), std::invalid_argument);
}

} // namespace gtest
