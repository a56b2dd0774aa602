/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auth_broker.h"
#include "common/stripe_log.h"

#include <absl/strings/str_format.h>
#include <future>
#include <memory>
#include <stdexcept>

void
stripeDisconnectQuietly(iStripeConnection &conn) {
    try {
        const stripe_status_t status = conn.disconnect();
        if (status != STRIPE_SUCCESS)
            STRIPE_WARN << "Ignoring disconnect failure on data-center " << conn.getDcId() << ": "
                        << stripeEnumStrings::statusStr(status);
    }
    catch (const std::exception &e) {
        STRIPE_WARN << "Ignoring disconnect failure on data-center " << conn.getDcId() << ": "
                    << e.what();
    }
}

stripeAuthBroker::stripeAuthBroker(std::shared_ptr<stripeSession> session,
                                   std::optional<stripe_dc_id_t> dc_id)
    : session_(std::move(session)) {
    if (!session_) throw std::invalid_argument("Auth broker needs a session");
    dcId_ = dc_id.value_or(session_->getHomeDcId());
}

stripe_status_t
stripeAuthBroker::authorize(iStripeConnection &conn) const {
    stripeAuthTicket ticket;
    stripe_status_t status = session_->getPrimary().exportAuthorization(dcId_, ticket);
    if (status != STRIPE_SUCCESS) {
        STRIPE_ERROR_FUNC << "authorization export for data-center " << dcId_
                          << " failed: " << stripeEnumStrings::statusStr(status);
        return status;
    }

    stripe_auth_key_t key;
    status = conn.importAuthorization(ticket, key);
    if (status != STRIPE_SUCCESS) {
        STRIPE_ERROR_FUNC << "authorization import on data-center " << dcId_
                          << " failed: " << stripeEnumStrings::statusStr(status);
        return status;
    }

    session_->cacheAuthorization(dcId_, key);
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeAuthBroker::createConnection(std::unique_ptr<iStripeConnection> &conn) const {
    iStripeTransport &transport = session_->getTransport();

    stripeEndpoint endpoint;
    stripe_status_t status = transport.getEndpoint(dcId_, endpoint);
    if (status != STRIPE_SUCCESS) {
        STRIPE_ERROR_FUNC << "no endpoint for data-center " << dcId_ << ": "
                          << stripeEnumStrings::statusStr(status);
        return STRIPE_ERR_SETUP;
    }

    const std::optional<stripe_auth_key_t> auth_key = session_->getAuthorization(dcId_);

    std::unique_ptr<iStripeConnection> new_conn;
    status = transport.connect(endpoint, auth_key, new_conn);
    if (status != STRIPE_SUCCESS || !new_conn) {
        STRIPE_ERROR_FUNC << absl::StrFormat("connect to data-center %d at %s:%d failed: %s",
                                             dcId_,
                                             endpoint.address,
                                             endpoint.port,
                                             stripeEnumStrings::statusStr(status));
        return STRIPE_ERR_SETUP;
    }

    if (!auth_key && authorize(*new_conn) != STRIPE_SUCCESS) {
        stripeDisconnectQuietly(*new_conn);
        return STRIPE_ERR_SETUP;
    }

    STRIPE_TRACE << "Connected to data-center " << dcId_
                 << (auth_key ? " with known authorization" : " with imported authorization");
    conn = std::move(new_conn);
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeAuthBroker::createConnections(uint16_t count,
                                    std::vector<std::unique_ptr<iStripeConnection>> &conns) const {
    conns.clear();
    if (count == 0) return STRIPE_SUCCESS;

    std::vector<std::unique_ptr<iStripeConnection>> opened(count);

    stripe_status_t status = createConnection(opened[0]);
    if (status != STRIPE_SUCCESS) return status;

    // Setup tasks run on the session executor and report through their own promise
    std::vector<std::future<stripe_status_t>> pending;
    try {
        pending.reserve(count - 1);
        asio::thread_pool &executor = session_->getExecutor();
        for (uint16_t i = 1; i < count; ++i) {
            auto status_promise = std::make_shared<std::promise<stripe_status_t>>();
            std::future<stripe_status_t> status_future = status_promise->get_future();
            asio::post(executor, [this, &opened, i, status_promise]() {
                try {
                    status_promise->set_value(createConnection(opened[i]));
                }
                catch (const std::exception &e) {
                    STRIPE_ERROR << "Connection " << i << " to data-center " << dcId_
                                 << " failed: " << e.what();
                    status_promise->set_value(STRIPE_ERR_SETUP);
                }
            });
            pending.push_back(std::move(status_future));
        }
    }
    catch (const std::exception &e) {
        STRIPE_ERROR << "Failed to schedule connections to data-center " << dcId_ << ": "
                     << e.what();
        status = STRIPE_ERR_SETUP;
    }

    // Every posted task has to finish before opened may be torn down
    for (auto &result : pending) {
        const stripe_status_t task_status = result.get();
        if (status == STRIPE_SUCCESS) status = task_status;
    }

    if (status != STRIPE_SUCCESS) {
        STRIPE_ERROR << "Failed to open " << count << " connections to data-center " << dcId_
                     << ", closing the ones already open";
        for (auto &conn : opened)
            if (conn) stripeDisconnectQuietly(*conn);
        return status;
    }

    STRIPE_DEBUG << "Opened " << count << " connections to data-center " << dcId_;
    conns = std::move(opened);
    return STRIPE_SUCCESS;
}
