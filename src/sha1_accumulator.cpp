//
//  sha1_accumulator.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "sha1_accumulator.hpp"

#include <openssl/evp.h>

#include "taf_error.hpp"

void Sha1Accumulator::CtxDeleter::operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }

Sha1Accumulator::Sha1Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw TafError(TafErrorKind::EncodeError, "EVP_MD_CTX_new failed");
    }
    if (!EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr)) {
        throw TafError(TafErrorKind::EncodeError, "EVP_DigestInit_ex(sha1) failed");
    }
}

Sha1Accumulator::~Sha1Accumulator() = default;

void Sha1Accumulator::update(const uint8_t *data, size_t size) {
    if (finalized_) {
        throw TafError(TafErrorKind::EncodeError, "sha1 update after finalize");
    }
    if (size == 0) {
        return;
    }
    if (!EVP_DigestUpdate(ctx_.get(), data, size)) {
        throw TafError(TafErrorKind::EncodeError, "EVP_DigestUpdate failed");
    }
    bytes_ += size;
}

Sha1Digest Sha1Accumulator::finalize() {
    if (finalized_) {
        throw TafError(TafErrorKind::EncodeError, "sha1 finalized twice");
    }
    finalized_ = true;
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (!EVP_DigestFinal_ex(ctx_.get(), md, &md_len) || md_len != kSha1DigestSize) {
        throw TafError(TafErrorKind::EncodeError, "EVP_DigestFinal_ex failed");
    }
    Sha1Digest out{};
    for (size_t i = 0; i < kSha1DigestSize; ++i) {
        out[i] = md[i];
    }
    return out;
}

Sha1Digest sha1_digest(const uint8_t *data, size_t size) {
    Sha1Accumulator acc;
    acc.update(data, size);
    return acc.finalize();
}
