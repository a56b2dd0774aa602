/*
 * SPDX-FileCopyrightText: Copyright (c) 2025-2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
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
#ifndef TEST_GTEST_COMMON_H
#define TEST_GTEST_COMMON_H

#include <cstdint>
#include <list>
#include <optional>
#include <regex>
#include <stack>
#include <string>
#include <utility>
#include "gtest/gtest.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_entry.h"

#include "stripe_types.h"

namespace gtest {

class ScopedEnv {
public:
    ScopedEnv() = default;
    ~ScopedEnv();

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &
    operator=(const ScopedEnv &) = delete;

    void
    addVar(const std::string &name, const std::string &value);
    void
    popVar();

private:
    class Variable {
    public:
        Variable(const std::string &name, const std::string &value);
        Variable(Variable &&other);
        ~Variable();

        Variable(const Variable &other) = delete;
        Variable &operator=(const Variable &other) = delete;

    private:
        std::optional<std::string> m_prev_value;
        std::string m_name;
    };

    std::stack<Variable> m_vars;
};

using log_ignore_entry_t = std::pair<std::regex, size_t>;

/**
 * @brief While alive, warnings and errors matching the expression are not counted as
 *        problems. Used around tests that provoke failures on purpose.
 */
class LogIgnoreGuard {
public:
    explicit LogIgnoreGuard(const std::regex &rx);
    explicit LogIgnoreGuard(const std::string &rx);
    ~LogIgnoreGuard();

    LogIgnoreGuard(const LogIgnoreGuard &) = delete;
    LogIgnoreGuard &
    operator=(const LogIgnoreGuard &) = delete;

    [[nodiscard]] size_t
    getIgnoredCount() const noexcept;

private:
    std::list<log_ignore_entry_t>::iterator iter_;
};

/**
 * @brief Log sink counting every warning or error not covered by a LogIgnoreGuard. A non-zero
 *        count fails the test run.
 */
class LogProblemCounter : public absl::LogSink {
public:
    LogProblemCounter();
    ~LogProblemCounter() override;

    LogProblemCounter(const LogProblemCounter &) = delete;
    LogProblemCounter &
    operator=(const LogProblemCounter &) = delete;

    [[nodiscard]] static size_t
    getProblemCount() noexcept;

    void
    Send(const absl::LogEntry &entry) override;
};

/**
 * @brief Deterministic test payload, byte i depends on i and seed only.
 */
stripe_bytes_t
makePattern(size_t size, uint32_t seed = 0);

} // namespace gtest

#endif /* TEST_GTEST_COMMON_H */
