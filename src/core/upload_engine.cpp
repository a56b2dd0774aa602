/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "upload_engine.h"
#include "auth_broker.h"
#include "common/md5.h"
#include "common/stripe_log.h"

#include <absl/strings/str_format.h>
#include <algorithm>
#include <limits>
#include <random>
#include <stdexcept>

stripe_file_id_t
stripeGenerateFileId() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<stripe_file_id_t> dist(
        1, std::numeric_limits<stripe_file_id_t>::max());
    return dist(generator);
}

stripeUploadEngine::stripeUploadEngine(std::shared_ptr<stripeSession> session)
    : session_(std::move(session)),
      uploadTicker_(0),
      dispatched_(0) {
    if (!session_) throw std::invalid_argument("Upload engine needs a session");
}

stripeUploadEngine::~stripeUploadEngine() {
    cleanup();
}

stripe_status_t
stripeUploadEngine::initSenders(stripe_file_id_t file_id) {
    std::vector<std::unique_ptr<iStripeConnection>> conns;
    const stripeAuthBroker broker(session_);

    const stripe_status_t status = broker.createConnections(plan_.connectionCount, conns);
    if (status != STRIPE_SUCCESS) return status;

    senders_.reserve(conns.size());
    for (uint32_t i = 0; i < conns.size(); ++i)
        senders_.push_back(std::make_unique<stripeUploadSender>(std::move(conns[i]),
                                                                file_id,
                                                                plan_.partCount,
                                                                plan_.isLargeObject,
                                                                i,
                                                                plan_.connectionCount));
    uploadTicker_ = 0;
    dispatched_ = 0;
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeUploadEngine::dispatch(stripe_bytes_t part, stripeProgressTracker *progress) {
    if (dispatched_ >= plan_.partCount) {
        STRIPE_ERROR_FUNC << "more parts than the planned " << plan_.partCount;
        return STRIPE_ERR_UNKNOWN;
    }

    const size_t part_len = part.size();
    const stripe_status_t status = senders_[uploadTicker_]->next(std::move(part));
    if (status != STRIPE_SUCCESS) return status;

    uploadTicker_ = (uploadTicker_ + 1) % senders_.size();
    ++dispatched_;
    if (progress) progress->add(part_len);
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeUploadEngine::readParts(std::istream &input,
                              size_t read_chunk_size,
                              stripeMd5 *md5,
                              stripeProgressTracker *progress) {
    std::vector<char> chunk(read_chunk_size);
    stripe_bytes_t buffer;
    buffer.reserve(plan_.partSize);
    uint64_t remaining = plan_.totalSize;

    while (remaining > 0) {
        const size_t to_read = static_cast<size_t>(std::min<uint64_t>(chunk.size(), remaining));
        input.read(chunk.data(), to_read);
        const size_t got = static_cast<size_t>(input.gcount());

        if (got == 0 || input.bad()) {
            STRIPE_ERROR << absl::StrFormat("Source ended or failed after %d of %d bytes",
                                            plan_.totalSize - remaining,
                                            plan_.totalSize);
            return STRIPE_ERR_IO;
        }
        remaining -= got;

        const uint8_t *data = reinterpret_cast<const uint8_t *>(chunk.data());
        if (md5) md5->update(data, got);

        // Re-chunk the read to exact part boundaries
        size_t consumed = 0;
        while (consumed < got) {
            const size_t take = std::min(plan_.partSize - buffer.size(), got - consumed);
            buffer.insert(buffer.end(), data + consumed, data + consumed + take);
            consumed += take;

            if (buffer.size() == plan_.partSize) {
                stripe_status_t status = dispatch(std::move(buffer), progress);
                if (status != STRIPE_SUCCESS) return status;
                buffer = stripe_bytes_t();
                buffer.reserve(plan_.partSize);
            }
        }
    }

    if (!buffer.empty()) return dispatch(std::move(buffer), progress);
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeUploadEngine::finishUpload() {
    stripe_status_t status = STRIPE_SUCCESS;
    for (auto &sender : senders_) {
        const stripe_status_t sender_status = sender->flush();
        if (status == STRIPE_SUCCESS) status = sender_status;
    }
    cleanup();
    return status;
}

void
stripeUploadEngine::cleanup() {
    for (auto &sender : senders_)
        sender->disconnect();
    senders_.clear();
}

stripe_status_t
stripeUploadEngine::upload(std::istream &input,
                           uint64_t total_size,
                           const std::string &name,
                           const stripeUploadParams &params,
                           stripeProgressTracker *progress,
                           stripeFileReference &ref) {
    stripe_status_t status =
        stripe::makePlan(total_size, params.maxConnections, plan_, params.overrides);
    if (status != STRIPE_SUCCESS) return status;

    const stripe_file_id_t file_id = stripeGenerateFileId();

    try {
        stripeMd5 md5;

        if (plan_.partCount == 0) {
            STRIPE_DEBUG << "Empty object " << name << ", no connections needed";
        } else {
            status = initSenders(file_id);
            if (status != STRIPE_SUCCESS) return status;

            const size_t read_chunk_size =
                params.readChunkSize > 0 ? params.readChunkSize : plan_.partSize;
            status = readParts(input, read_chunk_size, plan_.isLargeObject ? nullptr : &md5, progress);

            if (status != STRIPE_SUCCESS) {
                cleanup();
                return status;
            }

            status = finishUpload();
            if (status != STRIPE_SUCCESS) return status;
        }

        ref = stripeFileReference();
        ref.fileId = file_id;
        ref.partCount = plan_.partCount;
        ref.name = name;
        ref.isLarge = plan_.isLargeObject;
        if (!plan_.isLargeObject) ref.md5Checksum = md5.hexDigest();
    }
    catch (const std::exception &e) {
        STRIPE_ERROR << "Upload of " << name << " aborted: " << e.what();
        cleanup();
        return STRIPE_ERR_UNKNOWN;
    }

    if (progress) progress->finish();

    STRIPE_INFO << absl::StrFormat("Uploaded %s: %d bytes in %d parts over %d connections",
                                   name,
                                   plan_.totalSize,
                                   plan_.partCount,
                                   plan_.partCount ? plan_.connectionCount : 0);
    return STRIPE_SUCCESS;
}
