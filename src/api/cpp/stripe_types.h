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
#ifndef _STRIPE_TYPES_H
#define _STRIPE_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/*** Forward declarations ***/
class iStripeTransport;
class iStripeConnection;
class stripeSession;

/*** Status codes ***/
enum stripe_status_t {
    STRIPE_IN_PROG = 1,
    STRIPE_SUCCESS = 0,
    STRIPE_ERR_INVALID_PARAM = -1,
    STRIPE_ERR_SETUP = -2,
    STRIPE_ERR_TRANSFER = -3,
    STRIPE_ERR_IO = -4,
    STRIPE_ERR_NOT_FOUND = -5,
    STRIPE_ERR_MISMATCH = -6,
    STRIPE_ERR_NOT_ALLOWED = -7,
    STRIPE_ERR_UNKNOWN = -8,
};

namespace stripeEnumStrings {
std::string
statusStr(const stripe_status_t &status);
}

/*** Basic value types ***/
using stripe_bytes_t = std::vector<uint8_t>;
using stripe_dc_id_t = int32_t;
using stripe_file_id_t = int64_t;

// Authorization key of one data-center, opaque to the engine.
using stripe_auth_key_t = stripe_bytes_t;

/**
 * Progress callback, called with the bytes transferred so far and the object size.
 */
using stripe_progress_cb_t = std::function<void(uint64_t transferred, uint64_t total)>;

/**
 * @struct stripeEndpoint
 * @brief  Network address of a data-center.
 */
struct stripeEndpoint {
    stripe_dc_id_t dcId = 0;
    std::string address;
    uint16_t port = 0;
};

/**
 * @struct stripeAuthTicket
 * @brief  Exported authorization, valid for a single import on the target data-center.
 */
struct stripeAuthTicket {
    int64_t id = 0;
    stripe_bytes_t bytes;
};

/**
 * @struct stripeFileLocation
 * @brief  Address of a stored object that can be read back in byte ranges.
 */
struct stripeFileLocation {
    stripe_dc_id_t dcId = 0;
    int64_t objectId = 0;
    int64_t accessHash = 0;
};

/**
 * @struct stripeFileReference
 * @brief  Result of an upload, handed to whoever attaches the object to a message.
 *         Small objects carry the MD5 of the full content, large objects carry none.
 */
struct stripeFileReference {
    stripe_file_id_t fileId = 0;
    uint32_t partCount = 0;
    std::string name;
    bool isLarge = false;
    std::optional<std::string> md5Checksum;
};

/**
 * @struct stripeTransferPlan
 * @brief  Immutable sizing decisions for one transfer.
 */
struct stripeTransferPlan {
    uint64_t totalSize = 0;
    uint32_t partSize = 0;
    uint32_t partCount = 0;
    uint16_t connectionCount = 0;
    bool isLargeObject = false;
};

#endif
