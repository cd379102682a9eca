//
//  sha1_accumulator.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

inline constexpr size_t kSha1DigestSize = 20;
using Sha1Digest = std::array<uint8_t, kSha1DigestSize>;

// Incremental SHA-1 over the audio region, fed page bytes in on-disk order.
// One instance per output; finalize() may be called once.
class Sha1Accumulator {
   public:
    Sha1Accumulator();
    ~Sha1Accumulator();

    Sha1Accumulator(const Sha1Accumulator &) = delete;
    Sha1Accumulator &operator=(const Sha1Accumulator &) = delete;

    void update(const uint8_t *data, size_t size);
    void update(const std::vector<uint8_t> &data) { update(data.data(), data.size()); }

    // Throws TafError(EncodeError) when called twice or when libcrypto fails.
    Sha1Digest finalize();

    uint64_t bytes_hashed() const { return bytes_; }

   private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX *ctx) const;
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    uint64_t bytes_ = 0;
    bool finalized_ = false;
};

// One-shot convenience.
Sha1Digest sha1_digest(const uint8_t *data, size_t size);
