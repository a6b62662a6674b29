//
//  tonie_header.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "sha1_digest.hpp"

namespace tafforge {

/// @defgroup header TAF header region
/// Layout: 4-byte big-endian length, then protobuf-encoded metadata padded to 4092 bytes.
/// Audio always starts at byte 4096.
/// @{

inline constexpr uint64_t kTafHeaderRegionSize = 4096;
inline constexpr uint64_t kTafAudioOffset = kTafHeaderRegionSize;
inline constexpr uint32_t kTafLengthPrefixSize = 4;
inline constexpr uint32_t kTafHeaderPayloadSize =
    static_cast<uint32_t>(kTafHeaderRegionSize) - kTafLengthPrefixSize;

/**
 * @brief Decoded header metadata.
 *
 * Fields missing from the encoded form read back as their defaults (zero, empty, all-zero
 * digest).
 */
struct TonieHeader {
    uint64_t data_length = 0;              ///< Declared audio byte count
    uint32_t timestamp = 0;                ///< Producer timestamp; mirrors the stream serial
    std::vector<uint32_t> chapter_pages;   ///< Page indices where chapters start, ascending
    Sha1Digest audio_sha1{};               ///< SHA-1 of the audio region

    bool operator==(const TonieHeader &o) const {
        return data_length == o.data_length && timestamp == o.timestamp &&
               chapter_pages == o.chapter_pages && audio_sha1 == o.audio_sha1;
    }
    bool operator!=(const TonieHeader &o) const { return !(*this == o); }
};

struct HeaderReadResult {
    uint32_t header_length = 0;  ///< Declared metadata length (4092 for conforming writers)
    TonieHeader header;
};

/// Encode into exactly kTafHeaderPayloadSize bytes. Throws HeaderEncodeError when it cannot fit.
std::vector<uint8_t> encode_header(const TonieHeader &header);

/// Decode metadata bytes; unknown fields are ignored. Throws HeaderDecodeError.
TonieHeader decode_header(const uint8_t *data, size_t size);

/**
 * @brief Read the length prefix and metadata from the start of a stream.
 *
 * @param in Stream positioned anywhere; reading starts at byte 0.
 * @param file_size Total stream size, used to reject prefixes pointing past the end.
 * @throws HeaderDecodeError on a short file, an out-of-range prefix or malformed metadata.
 */
HeaderReadResult read_header(std::istream &in, uint64_t file_size);

/// Write the full 4096-byte header region at the current position. Returns false on I/O error.
bool write_header(std::ostream &out, const TonieHeader &header);

/// Re-encode the header region of an existing file in place; the audio region is untouched.
void rewrite_header(const std::string &path, const TonieHeader &header);

/// True when every entry is strictly greater than its predecessor.
bool chapter_pages_ascending(const std::vector<uint32_t> &pages);

/// @}

}  // namespace tafforge
