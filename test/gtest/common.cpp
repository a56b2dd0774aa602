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

#include "common.h"
#include <cstdlib>
#include <iostream>
#include <mutex>
#include "absl/log/log_sink_registry.h"

namespace gtest {

// Restore in reverse order so a variable set twice gets its original value back
ScopedEnv::~ScopedEnv() {
    while (!m_vars.empty())
        m_vars.pop();
}

void ScopedEnv::addVar(const std::string &name, const std::string &value)
{
    m_vars.emplace(name, value);
}

void
ScopedEnv::popVar() {
    m_vars.pop();
}

ScopedEnv::Variable::Variable(const std::string &name, const std::string &value)
    : m_name(name)
{
    const char* backup = getenv(name.c_str());

    if (backup != nullptr) {
        m_prev_value = backup;
    }

    setenv(name.c_str(), value.c_str(), 1);
}

ScopedEnv::Variable::Variable(Variable &&other)
    : m_prev_value(std::move(other.m_prev_value)),
      m_name(std::move(other.m_name))
{
    other.m_name.clear();
}

ScopedEnv::Variable::~Variable()
{
    if (m_name.empty()) {
        return;
    }

    if (m_prev_value) {
        setenv(m_name.c_str(), m_prev_value->c_str(), 1);
    } else {
        unsetenv(m_name.c_str());
    }
}

namespace {
    std::mutex log_problem_mutex;
    size_t global_problem_count = 0;
    std::list<log_ignore_entry_t> log_problem_ignore;

} // namespace

LogIgnoreGuard::LogIgnoreGuard(const std::regex &rx) {
    const std::lock_guard lock(log_problem_mutex);
    log_problem_ignore.emplace_front(rx, 0);
    iter_ = log_problem_ignore.begin();
}

LogIgnoreGuard::LogIgnoreGuard(const std::string &rx)
    : LogIgnoreGuard(std::regex(rx, std::regex_constants::extended)) {}

LogIgnoreGuard::~LogIgnoreGuard() {
    const std::lock_guard lock(log_problem_mutex);
    log_problem_ignore.erase(iter_);
}

size_t
LogIgnoreGuard::getIgnoredCount() const noexcept {
    const std::lock_guard lock(log_problem_mutex);
    return iter_->second;
}

LogProblemCounter::LogProblemCounter() {
    absl::AddLogSink(static_cast<absl::LogSink *>(this));
}

LogProblemCounter::~LogProblemCounter() {
    absl::RemoveLogSink(static_cast<absl::LogSink *>(this));
}

size_t
LogProblemCounter::getProblemCount() noexcept {
    const std::lock_guard lock(log_problem_mutex);
    return global_problem_count;
}

void
LogProblemCounter::Send(const absl::LogEntry &entry) {
    if (entry.log_severity() == absl::LogSeverity::kInfo) {
        return;
    }

    const std::string msg(entry.text_message());
    {
        const std::lock_guard lock(log_problem_mutex);
        for (auto &[rx, count] : log_problem_ignore) {
            if (std::regex_search(msg, rx)) {
                ++count;
                return;
            }
        }
        ++global_problem_count;
    }

    std::cerr << "ATTENTION: Unexpected stripe warning or error detected!" << std::endl;
    std::cerr << "ATTENTION: Message is '" << msg << '\'' << std::endl;
}

stripe_bytes_t
makePattern(size_t size, uint32_t seed) {
    stripe_bytes_t data(size);
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        // xorshift keeps neighbouring parts distinct
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        data[i] = static_cast<uint8_t>(state ^ (i >> 12));
    }
    return data;
}

} // namespace gtest
