/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef STRIPE_CORE_PART_SENDER_H
#define STRIPE_CORE_PART_SENDER_H

#include <future>
#include <memory>
#include <optional>
#include "stripe_transport.h"

/**
 * @class stripeUploadSender
 * @brief Uploads the parts of one stripe over a single connection. Starts at part index
 *        `index` and advances by `stride` after every issued part, keeping at most one
 *        request in flight.
 */
class stripeUploadSender {
public:
    stripeUploadSender(std::unique_ptr<iStripeConnection> conn,
                       stripe_file_id_t file_id,
                       uint32_t part_count,
                       bool big,
                       uint32_t index,
                       uint32_t stride);
    ~stripeUploadSender();

    stripeUploadSender(const stripeUploadSender &) = delete;
    stripeUploadSender &
    operator=(const stripeUploadSender &) = delete;

    /**
     * Wait for the previous part of this stripe, then issue data as the next part and return
     * without waiting for it.
     * @return Status of the previous part. On error data is not sent.
     */
    stripe_status_t
    next(stripe_bytes_t data);

    /**
     * Wait for the part in flight, if any.
     * @return Its status, STRIPE_SUCCESS when nothing was in flight
     */
    stripe_status_t
    flush();

    /**
     * Wait for the part in flight and tear down the connection. Safe to call repeatedly
     * and without any part ever sent. Failures are logged, not reported.
     */
    void
    disconnect();

    uint32_t
    getIndex() const {
        return index_;
    }

    uint32_t
    getSentCount() const {
        return sentCount_;
    }

private:
    std::unique_ptr<iStripeConnection> conn_;
    stripe_file_id_t fileId_;
    uint32_t partCount_;
    bool big_;
    uint32_t index_;
    uint32_t stride_;
    uint32_t sentCount_;
    std::optional<std::future<stripe_status_t>> previous_;
};

/**
 * Result of one fetch. An empty data member marks the end of the fetcher's stripe.
 */
struct stripeFetchResult {
    stripe_status_t status = STRIPE_SUCCESS;
    std::optional<stripe_bytes_t> data;
};

/**
 * @class stripeDownloadFetcher
 * @brief Reads the parts of one stripe over a single connection: `count` byte ranges of
 *        `limit` bytes starting at `offset`, each `stride` bytes after the previous one.
 */
class stripeDownloadFetcher {
public:
    stripeDownloadFetcher(std::unique_ptr<iStripeConnection> conn,
                          const stripeFileLocation &location,
                          uint64_t offset,
                          uint32_t limit,
                          uint64_t stride,
                          uint32_t count);
    ~stripeDownloadFetcher();

    stripeDownloadFetcher(const stripeDownloadFetcher &) = delete;
    stripeDownloadFetcher &
    operator=(const stripeDownloadFetcher &) = delete;

    /**
     * Issue the request for the next part of the stripe. The returned future is already
     * satisfied with an empty result once the stripe is exhausted.
     */
    std::future<stripeFetchResult>
    next();

    /**
     * Wait for the request in flight, if any, and tear down the connection.
     */
    void
    disconnect();

    uint32_t
    getRemaining() const {
        return remaining_;
    }

private:
    std::unique_ptr<iStripeConnection> conn_;
    stripeFileLocation location_;
    uint64_t offset_;
    uint32_t limit_;
    uint64_t stride_;
    uint32_t remaining_;
    // Satisfied once the request in flight has completed
    std::shared_future<void> pending_;
};

#endif // STRIPE_CORE_PART_SENDER_H
