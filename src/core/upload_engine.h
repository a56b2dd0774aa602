/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef STRIPE_CORE_UPLOAD_ENGINE_H
#define STRIPE_CORE_UPLOAD_ENGINE_H

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "part_sender.h"
#include "part_sizing.h"
#include "progress.h"
#include "stripe_session.h"

class stripeMd5;

struct stripeUploadParams {
    uint16_t maxConnections = stripe::defaultConnections;
    /** @var Bytes per read from the source, 0 reads one part at a time */
    size_t readChunkSize = 0;
    stripePlanOverrides overrides;
};

/**
 * @class stripeUploadEngine
 * @brief Uploads one object over several connections. Parts are handed to the senders in
 *        strict round-robin order, part k to sender k mod N, independently of how fast each
 *        connection completes. The remote side reassembles by part index.
 *        An engine runs one upload at a time.
 */
class stripeUploadEngine {
public:
    explicit stripeUploadEngine(std::shared_ptr<stripeSession> session);
    ~stripeUploadEngine();

    stripeUploadEngine(const stripeUploadEngine &) = delete;
    stripeUploadEngine &
    operator=(const stripeUploadEngine &) = delete;

    /**
     * @brief Upload total_size bytes read from input.
     *
     * @param input       Source stream, read sequentially
     * @param total_size  Number of bytes to upload
     * @param name        Name recorded in the file reference
     * @param params      Connection limit, read size and plan overrides
     * @param progress    Optional progress tracker, fed after every dispatched part
     * @param ref   [out] File reference, only set on success
     * @return STRIPE_SUCCESS, STRIPE_ERR_INVALID_PARAM, STRIPE_ERR_SETUP, STRIPE_ERR_TRANSFER or
     *         STRIPE_ERR_IO
     */
    stripe_status_t
    upload(std::istream &input,
           uint64_t total_size,
           const std::string &name,
           const stripeUploadParams &params,
           stripeProgressTracker *progress,
           stripeFileReference &ref);

    const stripeTransferPlan &
    getPlan() const {
        return plan_;
    }

private:
    stripe_status_t
    initSenders(stripe_file_id_t file_id);

    stripe_status_t
    dispatch(stripe_bytes_t part, stripeProgressTracker *progress);

    stripe_status_t
    readParts(std::istream &input,
              size_t read_chunk_size,
              stripeMd5 *md5,
              stripeProgressTracker *progress);

    stripe_status_t
    finishUpload();

    void
    cleanup();

    std::shared_ptr<stripeSession> session_;
    stripeTransferPlan plan_;
    std::vector<std::unique_ptr<stripeUploadSender>> senders_;
    uint32_t uploadTicker_;
    uint32_t dispatched_;
};

stripe_file_id_t
stripeGenerateFileId();

#endif // STRIPE_CORE_UPLOAD_ENGINE_H
