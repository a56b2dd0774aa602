/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "part_sender.h"
#include "auth_broker.h"
#include "common/stripe_log.h"

#include <absl/strings/str_format.h>
#include <stdexcept>

namespace {

stripe_status_t
toTransferStatus(stripe_status_t status, const char *what, uint64_t where) {
    if (status == STRIPE_SUCCESS) return STRIPE_SUCCESS;
    STRIPE_ERROR << absl::StrFormat(
        "%s %d failed: %s", what, where, stripeEnumStrings::statusStr(status));
    return STRIPE_ERR_TRANSFER;
}

} // namespace

/*** stripeUploadSender ***/

stripeUploadSender::stripeUploadSender(std::unique_ptr<iStripeConnection> conn,
                                       stripe_file_id_t file_id,
                                       uint32_t part_count,
                                       bool big,
                                       uint32_t index,
                                       uint32_t stride)
    : conn_(std::move(conn)),
      fileId_(file_id),
      partCount_(part_count),
      big_(big),
      index_(index),
      stride_(stride),
      sentCount_(0) {
    if (!conn_) throw std::invalid_argument("Upload sender needs a connection");
    if (stride_ == 0) throw std::invalid_argument("Upload sender stride must be positive");
}

stripeUploadSender::~stripeUploadSender() {
    disconnect();
}

stripe_status_t
stripeUploadSender::next(stripe_bytes_t data) {
    const stripe_status_t status = flush();
    if (status != STRIPE_SUCCESS) return status;

    // Completion runs on the transport executor and only touches the promise
    auto status_promise = std::make_shared<std::promise<stripe_status_t>>();
    std::future<stripe_status_t> status_future = status_promise->get_future();
    auto status_callback = [status_promise](stripe_status_t part_status) {
        status_promise->set_value(part_status);
    };

    STRIPE_TRACE << absl::StrFormat(
        "Sending part %d/%d of file %d (%d bytes)", index_, partCount_, fileId_, data.size());

    try {
        if (big_)
            conn_->saveBigFilePartAsync(
                fileId_, index_, partCount_, std::move(data), std::move(status_callback));
        else
            conn_->saveFilePartAsync(fileId_, index_, std::move(data), std::move(status_callback));
    }
    catch (const std::exception &e) {
        STRIPE_ERROR << "Failed to issue part " << index_ << ": " << e.what();
        return STRIPE_ERR_TRANSFER;
    }

    previous_ = std::move(status_future);
    index_ += stride_;
    ++sentCount_;
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeUploadSender::flush() {
    if (!previous_) return STRIPE_SUCCESS;

    const stripe_status_t status = previous_->get();
    previous_.reset();
    return toTransferStatus(status, "Upload of part", index_ - stride_);
}

void
stripeUploadSender::disconnect() {
    if (!conn_) return;

    // Any part failure was already reported through next() or flush()
    if (previous_) previous_->wait();
    previous_.reset();

    stripeDisconnectQuietly(*conn_);
    conn_.reset();
}

/*** stripeDownloadFetcher ***/

stripeDownloadFetcher::stripeDownloadFetcher(std::unique_ptr<iStripeConnection> conn,
                                             const stripeFileLocation &location,
                                             uint64_t offset,
                                             uint32_t limit,
                                             uint64_t stride,
                                             uint32_t count)
    : conn_(std::move(conn)),
      location_(location),
      offset_(offset),
      limit_(limit),
      stride_(stride),
      remaining_(count) {
    if (!conn_) throw std::invalid_argument("Download fetcher needs a connection");
    if (limit_ == 0) throw std::invalid_argument("Download fetcher limit must be positive");
}

stripeDownloadFetcher::~stripeDownloadFetcher() {
    disconnect();
}

std::future<stripeFetchResult>
stripeDownloadFetcher::next() {
    auto result_promise = std::make_shared<std::promise<stripeFetchResult>>();
    std::future<stripeFetchResult> result_future = result_promise->get_future();

    if (remaining_ == 0 || !conn_) {
        result_promise->set_value(stripeFetchResult{});
        return result_future;
    }

    // The result goes to the caller, disconnect() only waits for the completion
    auto done_promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> done_future = done_promise->get_future().share();

    const uint64_t offset = offset_;
    auto result_callback = [result_promise, done_promise, offset](stripe_status_t status,
                                                                  stripe_bytes_t data) {
        stripeFetchResult result;
        result.status = toTransferStatus(status, "Download of the part at offset", offset);
        if (result.status == STRIPE_SUCCESS) result.data = std::move(data);
        result_promise->set_value(std::move(result));
        done_promise->set_value();
    };

    STRIPE_TRACE << absl::StrFormat("Fetching %d bytes at offset %d of object %d",
                                    limit_,
                                    offset_,
                                    location_.objectId);

    try {
        conn_->getFilePartAsync(location_, offset_, limit_, std::move(result_callback));
    }
    catch (const std::exception &e) {
        STRIPE_ERROR << "Failed to issue download at offset " << offset_ << ": " << e.what();
        std::promise<stripeFetchResult> failed;
        failed.set_value(stripeFetchResult{STRIPE_ERR_TRANSFER, std::nullopt});
        return failed.get_future();
    }

    pending_ = std::move(done_future);
    --remaining_;
    offset_ += stride_;
    return result_future;
}

void
stripeDownloadFetcher::disconnect() {
    if (!conn_) return;

    if (pending_.valid()) pending_.wait();
    pending_ = {};

    stripeDisconnectQuietly(*conn_);
    conn_.reset();
}
