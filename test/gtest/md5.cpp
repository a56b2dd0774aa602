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

#include "common/md5.h"
#include "gtest/gtest.h"

#include <algorithm>
#include <string>

namespace {

const uint8_t *
asBytes(const std::string &s) {
    return reinterpret_cast<const uint8_t *>(s.data());
}

} // namespace

TEST(Md5, KnownDigests) {
    EXPECT_EQ(stripeMd5::hexDigestOf(nullptr, 0), "d41d8cd98f00b204e9800998ecf8427e");

    const std::string abc = "abc";
    EXPECT_EQ(stripeMd5::hexDigestOf(asBytes(abc), abc.size()),
              "900150983cd24fb0d6963f7d28e17f72");

    const std::string fox = "The quick brown fox jumps over the lazy dog";
    EXPECT_EQ(stripeMd5::hexDigestOf(asBytes(fox), fox.size()),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(Md5, Incremental) {
    const std::string fox = "The quick brown fox jumps over the lazy dog";

    stripeMd5 md5;
    for (size_t pos = 0; pos < fox.size(); pos += 5)
        md5.update(asBytes(fox) + pos, std::min<size_t>(5, fox.size() - pos));
    EXPECT_EQ(md5.hexDigest(), "9e107d9d372bb6826bd81d3542a419d6");

    // The digest restarts the computation
    EXPECT_EQ(md5.hexDigest(), "d41d8cd98f00b204e9800998ecf8427e");
}
