/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef STRIPE_SRC_UTILS_COMMON_MD5_H
#define STRIPE_SRC_UTILS_COMMON_MD5_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <openssl/evp.h>

/**
 * Incremental MD5 digest. Not thread-safe, owned by a single writer.
 */
class stripeMd5 {
public:
    stripeMd5();

    stripeMd5(const stripeMd5 &) = delete;
    stripeMd5 &
    operator=(const stripeMd5 &) = delete;

    void
    update(const uint8_t *data, size_t len);

    /**
     * Finish the digest and return it as lowercase hex. The object is reset afterwards.
     */
    std::string
    hexDigest();

    static std::string
    hexDigestOf(const uint8_t *data, size_t len);

private:
    struct ctxDeleter {
        void
        operator()(EVP_MD_CTX *ctx) const {
            EVP_MD_CTX_free(ctx);
        }
    };

    void
    reset();

    std::unique_ptr<EVP_MD_CTX, ctxDeleter> ctx_;
};

#endif // STRIPE_SRC_UTILS_COMMON_MD5_H
