/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "download_engine.h"
#include "auth_broker.h"
#include "common/stripe_log.h"

#include <absl/strings/str_format.h>
#include <stdexcept>

stripeDownloadEngine::stripeDownloadEngine(std::shared_ptr<stripeSession> session)
    : session_(std::move(session)),
      emitted_(0),
      emittedBytes_(0),
      active_(false),
      endStatus_(STRIPE_ERR_NOT_ALLOWED) {
    if (!session_) throw std::invalid_argument("Download engine needs a session");
}

stripeDownloadEngine::~stripeDownloadEngine() {
    stop();
}

stripe_status_t
stripeDownloadEngine::start(const stripeFileLocation &location,
                            uint64_t total_size,
                            const stripeDownloadParams &params) {
    stop();

    stripe_status_t status =
        stripe::makePlan(total_size, params.maxConnections, plan_, params.overrides);
    if (status != STRIPE_SUCCESS) return status;

    emitted_ = 0;
    emittedBytes_ = 0;

    if (plan_.partCount == 0) {
        STRIPE_DEBUG << "Empty object " << location.objectId << ", no connections needed";
        active_ = true;
        return STRIPE_SUCCESS;
    }

    std::vector<std::unique_ptr<iStripeConnection>> conns;
    const stripeAuthBroker broker(session_, location.dcId);
    status = broker.createConnections(plan_.connectionCount, conns);
    if (status != STRIPE_SUCCESS) return status;

    const uint32_t n = plan_.connectionCount;
    const uint32_t base = plan_.partCount / n;
    const uint32_t extra = plan_.partCount % n;

    try {
        fetchers_.reserve(n);
        for (uint32_t i = 0; i < n; ++i) {
            const uint32_t count = base + (i < extra ? 1 : 0);
            fetchers_.push_back(
                std::make_unique<stripeDownloadFetcher>(std::move(conns[i]),
                                                        location,
                                                        static_cast<uint64_t>(i) * plan_.partSize,
                                                        plan_.partSize,
                                                        static_cast<uint64_t>(n) * plan_.partSize,
                                                        count));
        }
    }
    catch (const std::exception &e) {
        STRIPE_ERROR << "Failed to set up download fetchers: " << e.what();
        for (auto &conn : conns)
            if (conn) stripeDisconnectQuietly(*conn);
        stop();
        return STRIPE_ERR_SETUP;
    }

    STRIPE_DEBUG << absl::StrFormat("Downloading object %d from dc %d: %d parts over %d connections",
                                    location.objectId,
                                    location.dcId,
                                    plan_.partCount,
                                    n);
    active_ = true;
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeDownloadEngine::checkPart(const stripe_bytes_t &part) const {
    const uint32_t index = emitted_ + static_cast<uint32_t>(ready_.size());
    if (index >= plan_.partCount) {
        STRIPE_ERROR << "Received part " << index << " beyond the planned " << plan_.partCount;
        return STRIPE_ERR_TRANSFER;
    }

    const uint64_t expected = (index + 1 < plan_.partCount) ?
        plan_.partSize :
        plan_.totalSize - static_cast<uint64_t>(plan_.partCount - 1) * plan_.partSize;

    if (part.size() != expected) {
        STRIPE_ERROR << absl::StrFormat(
            "Part %d has %d bytes, expected %d", index, part.size(), expected);
        return STRIPE_ERR_TRANSFER;
    }
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeDownloadEngine::fetchRound() {
    std::vector<std::future<stripeFetchResult>> round;
    round.reserve(fetchers_.size());

    // Issue the whole round before waiting on any of it
    for (auto &fetcher : fetchers_)
        if (fetcher->getRemaining() > 0) round.push_back(fetcher->next());

    stripe_status_t status = STRIPE_SUCCESS;
    for (auto &pending : round) {
        stripeFetchResult result = pending.get();
        if (status != STRIPE_SUCCESS) continue;

        if (result.status != STRIPE_SUCCESS) {
            status = result.status;
        } else if (!result.data) {
            STRIPE_ERROR << "Fetcher ended before its last part";
            status = STRIPE_ERR_TRANSFER;
        } else {
            status = checkPart(*result.data);
            if (status == STRIPE_SUCCESS) ready_.push_back(std::move(*result.data));
        }
    }
    return status;
}

stripe_status_t
stripeDownloadEngine::next(std::optional<stripe_bytes_t> &chunk) {
    chunk.reset();
    if (!active_) return endStatus_;

    if (ready_.empty() && emitted_ < plan_.partCount) {
        const stripe_status_t status = fetchRound();
        if (status != STRIPE_SUCCESS) return end(status);
    }

    if (ready_.empty()) {
        if (emittedBytes_ != plan_.totalSize) {
            STRIPE_ERROR << absl::StrFormat(
                "Download ended after %d of %d bytes", emittedBytes_, plan_.totalSize);
            return end(STRIPE_ERR_TRANSFER);
        }
        return end(STRIPE_SUCCESS);
    }

    chunk = std::move(ready_.front());
    ready_.pop_front();
    ++emitted_;
    emittedBytes_ += chunk->size();
    return STRIPE_SUCCESS;
}

void
stripeDownloadEngine::stop() {
    for (auto &fetcher : fetchers_)
        fetcher->disconnect();
    fetchers_.clear();
    ready_.clear();
    active_ = false;
    endStatus_ = STRIPE_ERR_NOT_ALLOWED;
}

stripe_status_t
stripeDownloadEngine::end(stripe_status_t status) {
    stop();
    endStatus_ = status;
    return status;
}

stripe_status_t
stripeDownloadEngine::download(const stripeFileLocation &location,
                               uint64_t total_size,
                               const stripeDownloadParams &params,
                               stripeProgressTracker *progress,
                               const stripe_chunk_sink_t &sink) {
    stripe_status_t status = start(location, total_size, params);
    if (status != STRIPE_SUCCESS) return status;

    std::optional<stripe_bytes_t> chunk;
    while (true) {
        status = next(chunk);
        if (status != STRIPE_SUCCESS) return status;
        if (!chunk) break;

        status = sink(*chunk);
        if (status != STRIPE_SUCCESS) {
            stop();
            return status;
        }
        if (progress) progress->add(chunk->size());
    }

    if (progress) progress->finish();
    STRIPE_INFO << absl::StrFormat("Downloaded object %d: %d bytes in %d parts",
                                   location.objectId,
                                   total_size,
                                   plan_.partCount);
    return STRIPE_SUCCESS;
}
