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
#ifndef STRIPE_SRC_UTILS_COMMON_STRIPE_LOG_H
#define STRIPE_SRC_UTILS_COMMON_STRIPE_LOG_H

#include "absl/log/log.h"

// Severity macros on top of abseil logging. DEBUG and TRACE map to verbose levels 1 and 2.
#define STRIPE_ERROR LOG(ERROR)
#define STRIPE_WARN LOG(WARNING)
#define STRIPE_INFO LOG(INFO)
#define STRIPE_DEBUG VLOG(1)
#define STRIPE_TRACE VLOG(2)

#define STRIPE_ERROR_FUNC STRIPE_ERROR << __func__ << ": "
#define STRIPE_WARN_FUNC STRIPE_WARN << __func__ << ": "

/**
 * Apply STRIPE_LOG_LEVEL (TRACE, DEBUG, INFO, WARN, ERROR or FATAL) to abseil logging.
 * Only the first call has an effect.
 */
void
stripeLogInit();

#endif // STRIPE_SRC_UTILS_COMMON_STRIPE_LOG_H
