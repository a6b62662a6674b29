//
//  sha1_digest.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "sha1_digest.hpp"

#include <algorithm>
#include <memory>
#include <openssl/evp.h>

#include "taf_errors.hpp"

namespace tafforge {

namespace {

constexpr size_t kHashChunkSize = 64 * 1024;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

class Sha1Context {
   public:
    Sha1Context() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            throw TafError("digest context allocation failed");
        }
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
            throw TafError("SHA-1 digest init failed");
        }
    }

    void update(const uint8_t *data, size_t size) {
        if (size == 0) {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw TafError("SHA-1 digest update failed");
        }
    }

    Sha1Digest finish() {
        std::array<uint8_t, EVP_MAX_MD_SIZE> out{};
        unsigned int out_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 || out_len != kSha1Size) {
            throw TafError("SHA-1 digest final failed");
        }
        Sha1Digest digest{};
        std::copy(out.begin(), out.begin() + kSha1Size, digest.begin());
        return digest;
    }

   private:
    UniqueMdCtx ctx_;
};

}  // namespace

Sha1Digest sha1_of(const std::vector<uint8_t> &data) {
    Sha1Context ctx;
    ctx.update(data.data(), data.size());
    return ctx.finish();
}

Sha1Digest sha1_of_stream(std::istream &in, uint64_t offset, uint64_t length) {
    Sha1Context ctx;
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    std::vector<uint8_t> chunk(kHashChunkSize);
    uint64_t remaining = length;
    while (remaining > 0 && in) {
        const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        in.read(reinterpret_cast<char *>(chunk.data()), static_cast<std::streamsize>(want));
        const size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            break;
        }
        ctx.update(chunk.data(), got);
        remaining -= got;
    }
    in.clear();
    return ctx.finish();
}

std::string to_hex(const uint8_t *data, size_t size) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace tafforge
