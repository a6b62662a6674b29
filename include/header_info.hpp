//
//  header_info.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "opus_stream.hpp"
#include "sha1_digest.hpp"
#include "tonie_header.hpp"

namespace tafforge {

/**
 * @brief Everything a caller needs to describe a TAF file.
 *
 * The audio fields are only meaningful when `opus_found` is true; `opus_error` then explains
 * why the audio region did not decode.
 */
struct TafHeaderInfo {
    uint32_t header_size = 0;
    TonieHeader header;
    uint64_t file_size = 0;
    uint64_t audio_size = 0;
    Sha1Digest sha1{};  ///< SHA-1 of the audio region as found on disk

    bool opus_found = false;
    std::optional<std::string> opus_error;
    uint8_t opus_version = 0;
    uint8_t channel_count = 0;
    uint32_t sample_rate = 0;
    uint32_t stream_serial = 0;
    uint16_t pre_skip = 0;
    std::string vendor;
    std::vector<std::pair<std::string, std::string>> comments;

    size_t page_count = 0;
    double duration_seconds = 0.0;
};

/**
 * @brief Decode header and audio facts of a file.
 *
 * @throws TafError when the file is missing or unreadable.
 * @throws HeaderDecodeError when the header region is malformed.
 * Audio decode failures do not throw; they clear `opus_found`.
 */
TafHeaderInfo read_header_info(const std::string &path);

}  // namespace tafforge
