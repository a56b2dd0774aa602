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

#ifndef STRIPE_SRC_UTILS_COMMON_CONFIGURATION_H
#define STRIPE_SRC_UTILS_COMMON_CONFIGURATION_H

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

#include <absl/strings/str_format.h>

#include "stripe_log.h"

namespace stripe::config {

// Environment variables understood by the library
inline constexpr char parallelConnectionsVar[] = "STRIPE_PARALLEL_CONNECTIONS";
inline constexpr char readChunkSizeVar[] = "STRIPE_READ_CHUNK_SIZE";
inline constexpr char progressIntervalVar[] = "STRIPE_PROGRESS_INTERVAL_MS";
inline constexpr char numThreadsVar[] = "STRIPE_NUM_THREADS";
inline constexpr char logLevelVar[] = "STRIPE_LOG_LEVEL";

[[nodiscard]] inline std::optional<std::string>
getenvOptional(const std::string &name) {
    if (const char *value = std::getenv(name.c_str())) {
        STRIPE_DEBUG << "Obtained environment variable " << name << "=" << value;
        return std::string(value);
    }
    STRIPE_DEBUG << "Missing environment variable " << name;
    return std::nullopt;
}

[[nodiscard]] inline std::string
getenvDefaulted(const std::string &name, const std::string &fallback) {
    return getenvOptional(name).value_or(fallback);
}

// Values are decimal counts, of the duration's own unit for durations
template<typename, typename = void> struct convertTraits;

template<typename integer>
struct convertTraits<integer, std::enable_if_t<std::is_integral_v<integer>>> {
    [[nodiscard]] static integer
    convert(const std::string &value) {
        integer result{};
        const char *last = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), last, result);

        if (ec == std::errc::result_out_of_range)
            throw std::runtime_error(absl::StrFormat(
                "'%s' does not fit in a %d-byte integer", value, sizeof(integer)));
        if (value.empty() || ec != std::errc() || ptr != last)
            throw std::runtime_error(absl::StrFormat("'%s' is not a decimal number", value));
        return result;
    }
};

template<typename rep, typename period> struct convertTraits<std::chrono::duration<rep, period>> {
    [[nodiscard]] static std::chrono::duration<rep, period>
    convert(const std::string &value) {
        return std::chrono::duration<rep, period>(convertTraits<rep>::convert(value));
    }
};

/**
 * Typed lookup of env, fallback when it is not set.
 * @throws std::runtime_error naming env when the value does not convert
 */
template<typename type>
[[nodiscard]] type
getValueDefaulted(const std::string &env, const type &fallback) {
    const std::optional<std::string> value = getenvOptional(env);
    if (!value) return fallback;

    try {
        return convertTraits<type>::convert(*value);
    }
    catch (const std::runtime_error &e) {
        throw std::runtime_error(absl::StrFormat("Environment variable %s: %s", env, e.what()));
    }
}

/**
 * Bounded lookup: a value outside [min, max] is rejected with a warning and the fallback is used.
 * Values that fail to convert still throw.
 */
template<typename type>
[[nodiscard]] type
getValueInRange(const std::string &env, const type &fallback, const type &min, const type &max) {
    const type value = getValueDefaulted<type>(env, fallback);
    if (value < min || value > max) {
        STRIPE_WARN << "Environment variable " << env << " out of range [" << min << ", " << max
                    << "], using " << fallback;
        return fallback;
    }
    return value;
}

} // namespace stripe::config

#endif
