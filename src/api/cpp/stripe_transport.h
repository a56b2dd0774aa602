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
#ifndef _STRIPE_TRANSPORT_H
#define _STRIPE_TRANSPORT_H

#include <memory>
#include <optional>
#include <asio.hpp>
#include "stripe_types.h"

using save_part_callback_t = std::function<void(stripe_status_t status)>;
using get_part_callback_t = std::function<void(stripe_status_t status, stripe_bytes_t data)>;

/**
 * Abstract interface for one authenticated connection to a data-center.
 * Authorization calls are synchronous, part calls are asynchronous and must
 * invoke their callback exactly once, from the executor of the owning transport.
 */
class iStripeConnection {
public:
    virtual ~iStripeConnection() = default;

    /**
     * Data-center this connection is bound to.
     */
    virtual stripe_dc_id_t
    getDcId() const = 0;

    /**
     * Export the authorization of this connection for use on another data-center.
     * @param dc_id Target data-center of the ticket
     * @param ticket Output ticket
     * @return STRIPE_SUCCESS or an error status
     */
    virtual stripe_status_t
    exportAuthorization(stripe_dc_id_t dc_id, stripeAuthTicket &ticket) = 0;

    /**
     * Import an exported authorization, authorizing this connection.
     * @param ticket Ticket previously exported for this connection's data-center
     * @param key Output authorization key, reusable for further connections to the same
     *            data-center
     * @return STRIPE_SUCCESS or an error status
     */
    virtual stripe_status_t
    importAuthorization(const stripeAuthTicket &ticket, stripe_auth_key_t &key) = 0;

    /**
     * Asynchronously store one part of a small object.
     * @param file_id Client chosen id of the upload
     * @param part_index Index of the part within the object
     * @param data Part payload, owned by the request until completion
     * @param callback Completion callback
     */
    virtual void
    saveFilePartAsync(stripe_file_id_t file_id,
                      uint32_t part_index,
                      stripe_bytes_t data,
                      save_part_callback_t callback) = 0;

    /**
     * Asynchronously store one part of a large object (no checksum variant).
     * @param file_id Client chosen id of the upload
     * @param part_index Index of the part within the object
     * @param part_count Total number of parts of the object
     * @param data Part payload, owned by the request until completion
     * @param callback Completion callback
     */
    virtual void
    saveBigFilePartAsync(stripe_file_id_t file_id,
                         uint32_t part_index,
                         uint32_t part_count,
                         stripe_bytes_t data,
                         save_part_callback_t callback) = 0;

    /**
     * Asynchronously read a byte range of a stored object.
     * @param location Object address
     * @param offset Offset of the first byte to read
     * @param limit Maximum number of bytes to return
     * @param callback Completion callback receiving the payload, shorter than limit at the end
     *                 of the object
     */
    virtual void
    getFilePartAsync(const stripeFileLocation &location,
                     uint64_t offset,
                     uint32_t limit,
                     get_part_callback_t callback) = 0;

    /**
     * Tear down the connection. Requests issued afterwards fail.
     */
    virtual stripe_status_t
    disconnect() = 0;
};

/**
 * Abstract interface for the transport supplied by the session-management collaborator.
 */
class iStripeTransport {
public:
    virtual ~iStripeTransport() = default;

    /**
     * Set the executor on which asynchronous completions run.
     * @param executor The executor to use for async operations
     */
    virtual void
    setExecutor(std::shared_ptr<asio::thread_pool> executor) = 0;

    /**
     * Look up the endpoint of a data-center.
     */
    virtual stripe_status_t
    getEndpoint(stripe_dc_id_t dc_id, stripeEndpoint &endpoint) = 0;

    /**
     * Open a new connection.
     * @param endpoint Data-center endpoint
     * @param auth_key Authorization of that data-center, or nullopt to connect unauthorized
     *                 (only authorization import is accepted on such a connection)
     * @param conn Output connection
     */
    virtual stripe_status_t
    connect(const stripeEndpoint &endpoint,
            const std::optional<stripe_auth_key_t> &auth_key,
            std::unique_ptr<iStripeConnection> &conn) = 0;
};

#endif
