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

#include "stripe_log.h"
#include "configuration.h"

#include <mutex>
#include <strings.h>

#include "absl/log/globals.h"
#include "absl/log/initialize.h"

namespace {

constexpr char defaultLogLevel[] = "WARN";

struct logLevel {
    const char *name;
    absl::LogSeverityAtLeast severity;
    int verbosity;
};

const logLevel logLevels[] = {
    {"TRACE", absl::LogSeverityAtLeast::kInfo, 2},
    {"DEBUG", absl::LogSeverityAtLeast::kInfo, 1},
    {"INFO", absl::LogSeverityAtLeast::kInfo, 0},
    {"WARN", absl::LogSeverityAtLeast::kWarning, 0},
    {"ERROR", absl::LogSeverityAtLeast::kError, 0},
    {"FATAL", absl::LogSeverityAtLeast::kFatal, 0},
};

void
applyLogLevel() {
    const std::string level =
        stripe::config::getenvDefaulted(stripe::config::logLevelVar, defaultLogLevel);

    for (const auto &entry : logLevels) {
        if (strcasecmp(entry.name, level.c_str()) == 0) {
            absl::SetMinLogLevel(entry.severity);
            absl::SetGlobalVLogLevel(entry.verbosity);
            return;
        }
    }

    absl::SetMinLogLevel(absl::LogSeverityAtLeast::kWarning);
    STRIPE_WARN << "Unknown " << stripe::config::logLevelVar << " '" << level << "', using "
                << defaultLogLevel;
}

} // namespace

void
stripeLogInit() {
    static std::once_flag log_init_flag;

    std::call_once(log_init_flag, []() {
        absl::InitializeLog();
        applyLogLevel();
    });
}
