//
//  sha1_digest.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <limits>
#include <string>
#include <vector>

namespace tafforge {

inline constexpr size_t kSha1Size = 20;
using Sha1Digest = std::array<uint8_t, kSha1Size>;

// SHA-1 of an in-memory buffer.
Sha1Digest sha1_of(const std::vector<uint8_t> &data);

// SHA-1 of up to `length` bytes starting at `offset`; hashes until EOF by default.
Sha1Digest sha1_of_stream(std::istream &in, uint64_t offset,
                          uint64_t length = std::numeric_limits<uint64_t>::max());

// Lowercase hex rendering.
std::string to_hex(const uint8_t *data, size_t size);
inline std::string to_hex(const Sha1Digest &digest) { return to_hex(digest.data(), digest.size()); }
inline std::string to_hex(const std::vector<uint8_t> &data) {
    return to_hex(data.data(), data.size());
}

}  // namespace tafforge
