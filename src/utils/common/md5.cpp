/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "md5.h"

#include <stdexcept>

#include <absl/strings/escaping.h>
#include <absl/strings/string_view.h>

stripeMd5::stripeMd5() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("Failed to allocate MD5 context");
    reset();
}

void
stripeMd5::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1)
        throw std::runtime_error("Failed to initialize MD5 digest");
}

void
stripeMd5::update(const uint8_t *data, size_t len) {
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1)
        throw std::runtime_error("Failed to update MD5 digest");
}

std::string
stripeMd5::hexDigest() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestFinal_ex(ctx_.get(), digest, &digest_len) != 1)
        throw std::runtime_error("Failed to finalize MD5 digest");
    reset();

    return absl::BytesToHexString(
        absl::string_view(reinterpret_cast<const char *>(digest), digest_len));
}

std::string
stripeMd5::hexDigestOf(const uint8_t *data, size_t len) {
    stripeMd5 md5;
    md5.update(data, len);
    return md5.hexDigest();
}
