/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef STRIPE_CORE_AUTH_BROKER_H
#define STRIPE_CORE_AUTH_BROKER_H

#include <memory>
#include <optional>
#include <vector>
#include "stripe_session.h"

/**
 * @class stripeAuthBroker
 * @brief Opens independently authenticated connections to the data-center owning a transfer.
 *        Connections to a data-center without a known authorization get one by exporting it
 *        from the primary connection and importing it on the new connection. The imported key
 *        is cached on the session and reused by later connections.
 */
class stripeAuthBroker {
public:
    /**
     * @param session Primary session
     * @param dc_id Target data-center, the session's home data-center when unset
     */
    explicit stripeAuthBroker(std::shared_ptr<stripeSession> session,
                              std::optional<stripe_dc_id_t> dc_id = std::nullopt);

    stripe_dc_id_t
    getDcId() const {
        return dcId_;
    }

    /**
     * Open one authenticated connection.
     * @return STRIPE_SUCCESS or STRIPE_ERR_SETUP
     */
    stripe_status_t
    createConnection(std::unique_ptr<iStripeConnection> &conn) const;

    /**
     * Open count connections. The first one is opened alone since it may populate the
     * authorization cache, the rest concurrently on the session executor. On failure every
     * connection already opened is disconnected and conns is left empty.
     * Must not be called from an executor thread.
     * @return STRIPE_SUCCESS or STRIPE_ERR_SETUP
     */
    stripe_status_t
    createConnections(uint16_t count, std::vector<std::unique_ptr<iStripeConnection>> &conns) const;

private:
    stripe_status_t
    authorize(iStripeConnection &conn) const;

    std::shared_ptr<stripeSession> session_;
    stripe_dc_id_t dcId_;
};

/**
 * Disconnect, logging instead of reporting failures so they never mask the error that
 * caused the teardown.
 */
void
stripeDisconnectQuietly(iStripeConnection &conn);

#endif // STRIPE_CORE_AUTH_BROKER_H
