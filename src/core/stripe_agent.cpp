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

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "stripe.h"
#include "download_engine.h"
#include "upload_engine.h"
#include "common/configuration.h"
#include "common/stripe_log.h"

#include <absl/strings/str_format.h>

/*** stripeEnumStrings ***/

std::string
stripeEnumStrings::statusStr(const stripe_status_t &status) {
    switch (status) {
    case STRIPE_IN_PROG:
        return "STRIPE_IN_PROG";
    case STRIPE_SUCCESS:
        return "STRIPE_SUCCESS";
    case STRIPE_ERR_INVALID_PARAM:
        return "STRIPE_ERR_INVALID_PARAM";
    case STRIPE_ERR_SETUP:
        return "STRIPE_ERR_SETUP";
    case STRIPE_ERR_TRANSFER:
        return "STRIPE_ERR_TRANSFER";
    case STRIPE_ERR_IO:
        return "STRIPE_ERR_IO";
    case STRIPE_ERR_NOT_FOUND:
        return "STRIPE_ERR_NOT_FOUND";
    case STRIPE_ERR_MISMATCH:
        return "STRIPE_ERR_MISMATCH";
    case STRIPE_ERR_NOT_ALLOWED:
        return "STRIPE_ERR_NOT_ALLOWED";
    case STRIPE_ERR_UNKNOWN:
        return "STRIPE_ERR_UNKNOWN";
    default:
        return "BAD_STATUS";
    }
}

/*** stripeAgentConfig ***/

stripeAgentConfig::stripeAgentConfig()
    : maxConnections(stripe::config::getValueInRange<uint16_t>(stripe::config::parallelConnectionsVar,
                                                               stripe::defaultConnections,
                                                               stripe::minConnections,
                                                               stripe::maxConnections)),
      readChunkSize(
          stripe::config::getValueDefaulted<size_t>(stripe::config::readChunkSizeVar, 0)),
      progressInterval(stripe::config::getValueDefaulted<std::chrono::milliseconds>(
          stripe::config::progressIntervalVar, std::chrono::milliseconds(0))) {}

/*** stripeAgent ***/

stripeAgent::stripeAgent(std::shared_ptr<stripeSession> session, const stripeAgentConfig &cfg)
    : session_(std::move(session)),
      config_(cfg) {
    if (!session_) throw std::invalid_argument("Agent needs a session");

    if (config_.maxConnections < stripe::minConnections ||
        config_.maxConnections > stripe::maxConnections)
        throw std::invalid_argument(absl::StrFormat("Connection limit %d outside [%d, %d]",
                                                    config_.maxConnections,
                                                    stripe::minConnections,
                                                    stripe::maxConnections));

    STRIPE_DEBUG << absl::StrFormat(
        "Agent created: up to %d connections, read chunk %d, progress interval %dms",
        config_.maxConnections,
        config_.readChunkSize,
        config_.progressInterval.count());
}

stripe_status_t
stripeAgent::uploadObject(const std::string &path,
                          stripeFileReference &ref,
                          uint64_t &size,
                          const stripe_progress_cb_t &on_progress) const {
    std::error_code ec;
    const uint64_t file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        STRIPE_ERROR << "Cannot stat " << path << ": " << ec.message();
        return STRIPE_ERR_IO;
    }

    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input) {
        STRIPE_ERROR << "Cannot open " << path << " for reading";
        return STRIPE_ERR_IO;
    }

    stripeUploadParams params;
    params.maxConnections = config_.maxConnections;
    params.readChunkSize = config_.readChunkSize;

    stripeProgressTracker progress(on_progress, file_size, config_.progressInterval);
    stripeUploadEngine engine(session_);

    const std::string name = std::filesystem::path(path).filename().string();
    const stripe_status_t status = engine.upload(input, file_size, name, params, &progress, ref);
    if (status != STRIPE_SUCCESS) {
        STRIPE_ERROR << "Upload of " << path
                     << " failed: " << stripeEnumStrings::statusStr(status);
        return status;
    }

    size = file_size;
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeAgent::downloadObject(const stripeFileLocation &location,
                            uint64_t size,
                            std::ostream &sink,
                            const stripe_progress_cb_t &on_progress) const {
    stripeDownloadParams params;
    params.maxConnections = config_.maxConnections;

    stripeProgressTracker progress(on_progress, size, config_.progressInterval);
    stripeDownloadEngine engine(session_);

    const stripe_status_t status = engine.download(
        location, size, params, &progress, [&sink](const stripe_bytes_t &chunk) {
            sink.write(reinterpret_cast<const char *>(chunk.data()), chunk.size());
            if (!sink) {
                STRIPE_ERROR << "Failed to write " << chunk.size() << " bytes to the sink";
                return STRIPE_ERR_IO;
            }
            return STRIPE_SUCCESS;
        });

    if (status != STRIPE_SUCCESS) {
        STRIPE_ERROR << "Download of object " << location.objectId
                     << " failed: " << stripeEnumStrings::statusStr(status);
        return status;
    }

    sink.flush();
    if (!sink) {
        STRIPE_ERROR << "Failed to flush the sink";
        return STRIPE_ERR_IO;
    }
    return STRIPE_SUCCESS;
}

stripe_status_t
stripeAgent::downloadObject(const stripeFileLocation &location,
                            uint64_t size,
                            const std::string &path,
                            const stripe_progress_cb_t &on_progress) const {
    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output) {
        STRIPE_ERROR << "Cannot open " << path << " for writing";
        return STRIPE_ERR_IO;
    }
    return downloadObject(location, size, static_cast<std::ostream &>(output), on_progress);
}
