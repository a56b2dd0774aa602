/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef STRIPE_CORE_DOWNLOAD_ENGINE_H
#define STRIPE_CORE_DOWNLOAD_ENGINE_H

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "part_sender.h"
#include "part_sizing.h"
#include "progress.h"
#include "stripe_session.h"

struct stripeDownloadParams {
    uint16_t maxConnections = stripe::defaultConnections;
    stripePlanOverrides overrides;
};

using stripe_chunk_sink_t = std::function<stripe_status_t(const stripe_bytes_t &chunk)>;

/**
 * @class stripeDownloadEngine
 * @brief Downloads one object over several connections as a lazy sequence of parts.
 *        Each round issues one request per fetcher and waits for the whole round, then
 *        releases its parts in fetcher ordinal order. Part k is therefore emitted in round
 *        k / N at ordinal k % N however the requests complete.
 *
 *        The sequence is not restartable, start() rebuilds all connections.
 */
class stripeDownloadEngine {
public:
    explicit stripeDownloadEngine(std::shared_ptr<stripeSession> session);
    ~stripeDownloadEngine();

    stripeDownloadEngine(const stripeDownloadEngine &) = delete;
    stripeDownloadEngine &
    operator=(const stripeDownloadEngine &) = delete;

    /**
     * @brief Plan the transfer and open the connections to the object's data-center.
     *        A previous unfinished sequence is abandoned.
     *
     * @return STRIPE_SUCCESS, STRIPE_ERR_INVALID_PARAM or STRIPE_ERR_SETUP
     */
    stripe_status_t
    start(const stripeFileLocation &location,
          uint64_t total_size,
          const stripeDownloadParams &params = stripeDownloadParams());

    /**
     * @brief Produce the next part of the object.
     *
     * @param chunk [out] Next part in order, std::nullopt once the object is complete
     * @return STRIPE_SUCCESS or STRIPE_ERR_TRANSFER. After an error the sequence is over,
     *         every connection is closed and later calls return the same error.
     *         STRIPE_ERR_NOT_ALLOWED when the sequence was never started or was stopped.
     */
    stripe_status_t
    next(std::optional<stripe_bytes_t> &chunk);

    /**
     * @brief Abandon the sequence and close every connection. Later next() calls return
     *        STRIPE_ERR_NOT_ALLOWED until the next start().
     */
    void
    stop();

    /**
     * @brief Run a whole download, handing every part to sink in order.
     *        The first error returned by sink aborts the transfer and is returned.
     */
    stripe_status_t
    download(const stripeFileLocation &location,
             uint64_t total_size,
             const stripeDownloadParams &params,
             stripeProgressTracker *progress,
             const stripe_chunk_sink_t &sink);

    const stripeTransferPlan &
    getPlan() const {
        return plan_;
    }

    bool
    isActive() const {
        return active_;
    }

private:
    stripe_status_t
    fetchRound();

    stripe_status_t
    checkPart(const stripe_bytes_t &part) const;

    /** Close the sequence, next() keeps returning status afterwards */
    stripe_status_t
    end(stripe_status_t status);

    std::shared_ptr<stripeSession> session_;
    stripeTransferPlan plan_;
    std::vector<std::unique_ptr<stripeDownloadFetcher>> fetchers_;
    std::deque<stripe_bytes_t> ready_;
    uint32_t emitted_;
    uint64_t emittedBytes_;
    bool active_;
    stripe_status_t endStatus_;
};

#endif // STRIPE_CORE_DOWNLOAD_ENGINE_H
