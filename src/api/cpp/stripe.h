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
#ifndef _STRIPE_H
#define _STRIPE_H

#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>
#include "stripe_types.h"
#include "stripe_session.h"

/**
 * @class stripeAgentConfig
 * @brief Per-agent transfer settings. Defaults are read from the environment.
 */
class stripeAgentConfig {
public:
    /** @var Upper bound on connections opened per transfer, 1..20 */
    uint16_t maxConnections;
    /** @var Size of each read from the source file, 0 reads one part at a time */
    size_t readChunkSize;
    /** @var Minimum interval between progress callbacks, 0 reports every part */
    std::chrono::milliseconds progressInterval;

    /**
     * @brief Agent configuration constructor, taking defaults from STRIPE_PARALLEL_CONNECTIONS,
     *        STRIPE_READ_CHUNK_SIZE and STRIPE_PROGRESS_INTERVAL_MS.
     */
    stripeAgentConfig();

    stripeAgentConfig(uint16_t max_connections,
                      size_t read_chunk_size = 0,
                      std::chrono::milliseconds progress_interval = std::chrono::milliseconds(0))
        : maxConnections(max_connections),
          readChunkSize(read_chunk_size),
          progressInterval(progress_interval) {}
};

/**
 * @class stripeAgent
 * @brief Caller-facing striped transfer API on top of a primary session.
 */
class stripeAgent {
public:
    stripeAgent(std::shared_ptr<stripeSession> session,
                const stripeAgentConfig &cfg = stripeAgentConfig());

    /**
     * @brief Upload a local file over several connections.
     *
     * @param path        Source file
     * @param ref   [out] Reference of the uploaded object
     * @param size  [out] Number of bytes uploaded
     * @param on_progress Optional progress callback
     * @return STRIPE_SUCCESS, STRIPE_ERR_IO if the source cannot be read, STRIPE_ERR_SETUP or
     *         STRIPE_ERR_TRANSFER if a connection or part call failed
     */
    stripe_status_t
    uploadObject(const std::string &path,
                 stripeFileReference &ref,
                 uint64_t &size,
                 const stripe_progress_cb_t &on_progress = nullptr) const;

    /**
     * @brief Download a stored object over several connections, writing it to sink in order.
     *        On failure the sink holds an incomplete prefix of the object.
     *
     * @param location    Object address
     * @param size        Object size in bytes
     * @param sink        Destination stream
     * @param on_progress Optional progress callback
     * @return STRIPE_SUCCESS, STRIPE_ERR_IO if the sink cannot be written, STRIPE_ERR_SETUP or
     *         STRIPE_ERR_TRANSFER if a connection or part call failed
     */
    stripe_status_t
    downloadObject(const stripeFileLocation &location,
                   uint64_t size,
                   std::ostream &sink,
                   const stripe_progress_cb_t &on_progress = nullptr) const;

    /**
     * @brief Same as above, writing to the file at path. A partial file is left behind on
     *        failure.
     */
    stripe_status_t
    downloadObject(const stripeFileLocation &location,
                   uint64_t size,
                   const std::string &path,
                   const stripe_progress_cb_t &on_progress = nullptr) const;

    const stripeAgentConfig &
    getConfig() const {
        return config_;
    }

private:
    std::shared_ptr<stripeSession> session_;
    stripeAgentConfig config_;
};

#endif
