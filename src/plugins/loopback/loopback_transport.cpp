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

#include "loopback_transport.h"
#include "part_sizing.h"
#include "common/md5.h"
#include "common/stripe_log.h"

#include <absl/strings/str_format.h>
#include <algorithm>
#include <stdexcept>

namespace {

constexpr uint16_t loopbackBasePort = 4430;
constexpr size_t authKeyLen = 256;
constexpr size_t ticketLen = 64;

} // namespace

/*** stripeLoopbackStore ***/

stripeLoopbackStore::stripeLoopbackStore(const std::vector<stripe_dc_id_t> &dc_ids)
    : random_(std::random_device{}()),
      dcIds_(dc_ids.begin(), dc_ids.end()),
      maxLatency_(0),
      connects_(0),
      disconnects_(0),
      imports_(0) {
    if (dcIds_.empty()) throw std::invalid_argument("Loopback store needs a data-center");
}

stripe_bytes_t
stripeLoopbackStore::randomBytes(size_t len) {
    std::uniform_int_distribution<int> dist(0, 255);
    stripe_bytes_t bytes(len);
    for (auto &b : bytes)
        b = static_cast<uint8_t>(dist(random_));
    return bytes;
}

stripe_status_t
stripeLoopbackStore::authorize(stripe_dc_id_t dc_id, stripe_auth_key_t &key) {
    const std::lock_guard<std::mutex> lock(lock_);
    if (!dcIds_.count(dc_id)) return STRIPE_ERR_NOT_FOUND;

    key = randomBytes(authKeyLen);
    keys_[dc_id].insert(key);
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeLoopbackStore::getEndpoint(stripe_dc_id_t dc_id, stripeEndpoint &endpoint) const {
    if (!dcIds_.count(dc_id)) return STRIPE_ERR_NOT_FOUND;

    endpoint.dcId = dc_id;
    endpoint.address = "127.0.0.1";
    endpoint.port = static_cast<uint16_t>(loopbackBasePort + dc_id);
    return STRIPE_SUCCESS;
}

bool
stripeLoopbackStore::isKeyValid(stripe_dc_id_t dc_id, const stripe_auth_key_t &key) const {
    const std::lock_guard<std::mutex> lock(lock_);
    auto it = keys_.find(dc_id);
    return it != keys_.end() && it->second.count(key) > 0;
}

stripe_status_t
stripeLoopbackStore::exportAuthorization(stripe_dc_id_t dc_id, stripeAuthTicket &ticket) {
    const std::lock_guard<std::mutex> lock(lock_);
    if (!dcIds_.count(dc_id)) return STRIPE_ERR_NOT_FOUND;

    pendingTicket pending;
    pending.dcId = dc_id;
    pending.bytes = randomBytes(ticketLen);

    ticket.id = static_cast<int64_t>(random_() >> 1);
    ticket.bytes = pending.bytes;
    tickets_[ticket.id] = std::move(pending);
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeLoopbackStore::importAuthorization(stripe_dc_id_t dc_id,
                                         const stripeAuthTicket &ticket,
                                         stripe_auth_key_t &key) {
    const std::lock_guard<std::mutex> lock(lock_);
    auto it = tickets_.find(ticket.id);
    if (it == tickets_.end()) return STRIPE_ERR_NOT_FOUND;
    if (it->second.dcId != dc_id || it->second.bytes != ticket.bytes) return STRIPE_ERR_MISMATCH;

    // Tickets are single use
    tickets_.erase(it);

    key = randomBytes(authKeyLen);
    keys_[dc_id].insert(key);
    ++imports_;
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeLoopbackStore::savePart(stripe_file_id_t file_id,
                              uint32_t part_index,
                              std::optional<uint32_t> part_count,
                              stripe_bytes_t data) {
    if (data.empty() || data.size() > stripe::maxPartSize) return STRIPE_ERR_INVALID_PARAM;
    if (part_count && part_index >= *part_count) return STRIPE_ERR_INVALID_PARAM;

    const std::lock_guard<std::mutex> lock(lock_);
    auto it = uploads_.find(file_id);
    if (it == uploads_.end()) {
        uploadSession session;
        session.big = part_count.has_value();
        session.partCount = part_count.value_or(0);
        it = uploads_.emplace(file_id, std::move(session)).first;
    }

    uploadSession &session = it->second;
    if (session.big != part_count.has_value()) return STRIPE_ERR_MISMATCH;
    if (part_count && session.partCount != *part_count) return STRIPE_ERR_MISMATCH;

    // Re-sending a part replaces it
    session.parts[part_index] = std::move(data);
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeLoopbackStore::publish(const stripeFileReference &ref,
                             stripe_dc_id_t dc_id,
                             stripeFileLocation &location) {
    const std::lock_guard<std::mutex> lock(lock_);
    if (!dcIds_.count(dc_id)) return STRIPE_ERR_NOT_FOUND;

    uploadSession empty_session;
    uploadSession *session = &empty_session;
    auto it = uploads_.find(ref.fileId);
    if (it != uploads_.end()) {
        session = &it->second;
    } else if (ref.partCount != 0) {
        STRIPE_ERROR << "No upload with file id " << ref.fileId;
        return STRIPE_ERR_NOT_FOUND;
    }

    if (session->big != ref.isLarge || (ref.isLarge && session->partCount != ref.partCount)) {
        STRIPE_ERROR << "Upload " << ref.fileId << " does not match the reference kind";
        return STRIPE_ERR_MISMATCH;
    }

    if (session->parts.size() != ref.partCount ||
        (ref.partCount > 0 && session->parts.rbegin()->first != ref.partCount - 1)) {
        STRIPE_ERROR << absl::StrFormat("Upload %d has %d parts, expected indices 0..%d",
                                        ref.fileId,
                                        session->parts.size(),
                                        static_cast<int64_t>(ref.partCount) - 1);
        return STRIPE_ERR_MISMATCH;
    }

    const size_t part_size = ref.partCount ? session->parts.begin()->second.size() : 0;
    if (ref.partCount > 1 && (part_size % stripe::KiB || stripe::maxPartSize % part_size)) {
        STRIPE_ERROR << "Part size " << part_size << " is not a valid step";
        return STRIPE_ERR_MISMATCH;
    }

    storedObject object;
    object.dcId = dc_id;
    object.accessHash = static_cast<int64_t>(random_() >> 1);

    for (const auto &[index, bytes] : session->parts) {
        const bool last = index + 1 == ref.partCount;
        if ((!last && bytes.size() != part_size) || (last && bytes.size() > part_size)) {
            STRIPE_ERROR << absl::StrFormat(
                "Part %d of upload %d has %d bytes, part size is %d", index, ref.fileId,
                bytes.size(), part_size);
            return STRIPE_ERR_MISMATCH;
        }
        object.data.insert(object.data.end(), bytes.begin(), bytes.end());
    }

    if (!ref.isLarge) {
        const std::string digest = stripeMd5::hexDigestOf(object.data.data(), object.data.size());
        if (!ref.md5Checksum || *ref.md5Checksum != digest) {
            STRIPE_ERROR << "Checksum mismatch for upload " << ref.fileId << ": got " << digest;
            return STRIPE_ERR_MISMATCH;
        }
    }

    if (it != uploads_.end()) uploads_.erase(it);

    int64_t object_id;
    do {
        object_id = static_cast<int64_t>(random_() >> 1);
    } while (object_id == 0 || objects_.count(object_id));

    location.dcId = dc_id;
    location.objectId = object_id;
    location.accessHash = object.accessHash;

    STRIPE_DEBUG << absl::StrFormat("Published %s as object %d on dc %d (%d bytes)",
                                    ref.name,
                                    object_id,
                                    dc_id,
                                    object.data.size());
    objects_.emplace(object_id, std::move(object));
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeLoopbackStore::getObjectSize(const stripeFileLocation &location, uint64_t &size) const {
    const std::lock_guard<std::mutex> lock(lock_);
    auto it = objects_.find(location.objectId);
    if (it == objects_.end()) return STRIPE_ERR_NOT_FOUND;
    if (it->second.accessHash != location.accessHash) return STRIPE_ERR_NOT_ALLOWED;

    size = it->second.data.size();
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeLoopbackStore::readRange(const stripeFileLocation &location,
                               uint64_t offset,
                               uint32_t limit,
                               stripe_bytes_t &data) const {
    const std::lock_guard<std::mutex> lock(lock_);
    auto it = objects_.find(location.objectId);
    if (it == objects_.end()) return STRIPE_ERR_NOT_FOUND;

    const storedObject &object = it->second;
    if (object.accessHash != location.accessHash) return STRIPE_ERR_NOT_ALLOWED;
    if (object.dcId != location.dcId) return STRIPE_ERR_MISMATCH;

    data.clear();
    if (offset >= object.data.size()) return STRIPE_SUCCESS;

    const uint64_t len = std::min<uint64_t>(limit, object.data.size() - offset);
    data.assign(object.data.begin() + offset, object.data.begin() + offset + len);
    return STRIPE_SUCCESS;
}

void
stripeLoopbackStore::setLatency(std::chrono::microseconds max_latency) {
    const std::lock_guard<std::mutex> lock(lock_);
    maxLatency_ = max_latency;
}

std::chrono::microseconds
stripeLoopbackStore::drawLatency() {
    const std::lock_guard<std::mutex> lock(lock_);
    if (maxLatency_.count() <= 0) return std::chrono::microseconds(0);

    std::uniform_int_distribution<int64_t> dist(0, maxLatency_.count());
    return std::chrono::microseconds(dist(random_));
}

/*** stripeLoopbackConnection ***/

stripeLoopbackConnection::stripeLoopbackConnection(std::shared_ptr<stripeLoopbackStore> store,
                                                   std::shared_ptr<asio::thread_pool> executor,
                                                   stripe_dc_id_t dc_id,
                                                   bool authorized)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      dcId_(dc_id),
      authorized_(authorized),
      connected_(true) {
    store_->countConnect();
}

stripeLoopbackConnection::~stripeLoopbackConnection() = default;

stripe_status_t
stripeLoopbackConnection::checkUsable() const {
    if (!connected_) return STRIPE_ERR_NOT_ALLOWED;
    if (!authorized_) return STRIPE_ERR_NOT_ALLOWED;
    return STRIPE_SUCCESS;
}

void
stripeLoopbackConnection::complete(std::function<void()> work) {
    if (!executor_) throw std::runtime_error("Loopback transport has no executor");

    const std::chrono::microseconds delay = store_->drawLatency();
    if (delay.count() == 0) {
        asio::post(*executor_, std::move(work));
        return;
    }

    auto timer = std::make_shared<asio::steady_timer>(*executor_, delay);
    timer->async_wait([timer, work = std::move(work)](const asio::error_code &) { work(); });
}

stripe_status_t
stripeLoopbackConnection::exportAuthorization(stripe_dc_id_t dc_id, stripeAuthTicket &ticket) {
    const stripe_status_t status = checkUsable();
    if (status != STRIPE_SUCCESS) return status;
    return store_->exportAuthorization(dc_id, ticket);
}

stripe_status_t
stripeLoopbackConnection::importAuthorization(const stripeAuthTicket &ticket,
                                              stripe_auth_key_t &key) {
    if (!connected_) return STRIPE_ERR_NOT_ALLOWED;

    const stripe_status_t status = store_->importAuthorization(dcId_, ticket, key);
    if (status == STRIPE_SUCCESS) authorized_ = true;
    return status;
}

void
stripeLoopbackConnection::saveFilePartAsync(stripe_file_id_t file_id,
                                            uint32_t part_index,
                                            stripe_bytes_t data,
                                            save_part_callback_t callback) {
    const stripe_status_t usable = checkUsable();
    auto store = store_;
    complete([store, usable, file_id, part_index, data = std::move(data), callback]() mutable {
        if (usable != STRIPE_SUCCESS) {
            callback(usable);
            return;
        }
        callback(store->savePart(file_id, part_index, std::nullopt, std::move(data)));
    });
}

void
stripeLoopbackConnection::saveBigFilePartAsync(stripe_file_id_t file_id,
                                               uint32_t part_index,
                                               uint32_t part_count,
                                               stripe_bytes_t data,
                                               save_part_callback_t callback) {
    const stripe_status_t usable = checkUsable();
    auto store = store_;
    complete([store, usable, file_id, part_index, part_count, data = std::move(data), callback]()
                 mutable {
                     if (usable != STRIPE_SUCCESS) {
                         callback(usable);
                         return;
                     }
                     callback(store->savePart(file_id, part_index, part_count, std::move(data)));
                 });
}

void
stripeLoopbackConnection::getFilePartAsync(const stripeFileLocation &location,
                                           uint64_t offset,
                                           uint32_t limit,
                                           get_part_callback_t callback) {
    stripe_status_t usable = checkUsable();
    // Objects are only served by the data-center holding them
    if (usable == STRIPE_SUCCESS && location.dcId != dcId_) usable = STRIPE_ERR_MISMATCH;

    auto store = store_;
    complete([store, usable, location, offset, limit, callback]() {
        if (usable != STRIPE_SUCCESS) {
            callback(usable, {});
            return;
        }
        stripe_bytes_t data;
        const stripe_status_t status = store->readRange(location, offset, limit, data);
        callback(status, std::move(data));
    });
}

stripe_status_t
stripeLoopbackConnection::disconnect() {
    if (!connected_.exchange(false)) return STRIPE_ERR_NOT_ALLOWED;
    store_->countDisconnect();
    return STRIPE_SUCCESS;
}

/*** stripeLoopbackTransport ***/

stripeLoopbackTransport::stripeLoopbackTransport(std::shared_ptr<stripeLoopbackStore> store)
    : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("Loopback transport needs a store");
}

stripe_status_t
stripeLoopbackTransport::getEndpoint(stripe_dc_id_t dc_id, stripeEndpoint &endpoint) {
    return store_->getEndpoint(dc_id, endpoint);
}

stripe_status_t
stripeLoopbackTransport::connect(const stripeEndpoint &endpoint,
                                 const std::optional<stripe_auth_key_t> &auth_key,
                                 std::unique_ptr<iStripeConnection> &conn) {
    stripeEndpoint known;
    if (store_->getEndpoint(endpoint.dcId, known) != STRIPE_SUCCESS ||
        known.address != endpoint.address || known.port != endpoint.port)
        return STRIPE_ERR_NOT_FOUND;

    if (auth_key && !store_->isKeyValid(endpoint.dcId, *auth_key)) {
        STRIPE_ERROR << "Authorization key rejected by data-center " << endpoint.dcId;
        return STRIPE_ERR_NOT_ALLOWED;
    }

    conn = std::make_unique<stripeLoopbackConnection>(
        store_, executor_, endpoint.dcId, auth_key.has_value());
    return STRIPE_SUCCESS;
}
