//
//  opus_stream.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ogg_page.hpp"
#include "taf_file.hpp"

namespace tafforge {

inline constexpr uint32_t kOpusSampleRate = 48000;  // Opus always decodes at 48 kHz
inline constexpr uint64_t kTafPageAlignment = 4096;

// Stream-identification packet ("OpusHead").
struct OpusHead {
    uint8_t version = 0;
    uint8_t channel_count = 0;
    uint16_t pre_skip = 0;
    uint32_t input_sample_rate = 0;
    int16_t output_gain = 0;
    uint8_t mapping_family = 0;
};

// Comments packet ("OpusTags"). Keys are uppercased; order is preserved.
struct OpusTags {
    std::string vendor;
    std::vector<std::pair<std::string, std::string>> comments;
};

/**
 * @brief Facts about the embedded audio, derived from the first two pages.
 */
struct AudioStreamInfo {
    uint8_t opus_version = 0;
    uint8_t channel_count = 0;
    uint32_t sample_rate = 0;
    uint16_t pre_skip = 0;
    int16_t output_gain = 0;
    uint8_t mapping_family = 0;
    uint32_t stream_serial = 0;
    bool serial_consistent = true;  ///< false when page 1 carries a different serial
    std::string vendor;
    std::vector<std::pair<std::string, std::string>> comments;

    /// First value for a (case-insensitive) tag name.
    std::optional<std::string> comment(const std::string &key) const;
};

/**
 * @brief One pass over every page of the audio region.
 *
 * Anomaly lists hold page indices (0-based, counted from the audio region start).
 */
struct StreamSummary {
    size_t page_count = 0;
    int64_t last_granule = 0;
    uint32_t stream_serial = 0;
    uint64_t audio_bytes = 0;  ///< bytes covered by parsed pages
    std::vector<size_t> serial_anomalies;
    std::vector<size_t> sequence_gaps;
    std::vector<size_t> checksum_failures;
    std::vector<size_t> unaligned_pages;
    OggPageReader::StopReason stop_reason = OggPageReader::StopReason::None;

    bool ended_cleanly() const { return stop_reason == OggPageReader::StopReason::EndOfStream; }
};

/// Decode an OpusHead packet. Throws StreamFormatError.
OpusHead parse_opus_head(const std::vector<uint8_t> &packet);

/// Decode an OpusTags packet; a packet truncated after the vendor string yields the comments
/// read so far. Throws StreamFormatError.
OpusTags parse_opus_tags(const std::vector<uint8_t> &packet);

/**
 * @brief Decode the first two pages at `offset` as OpusHead + OpusTags.
 *
 * @throws StreamFormatError when either page is missing, lacks the capture pattern or does not
 *         carry the expected packet.
 */
AudioStreamInfo analyze_audio_stream(std::istream &in, uint64_t offset = kTafAudioOffset);

/// analyze_audio_stream() on a file's audio region.
AudioStreamInfo analyze(const TafFile &file);

/// Walk all pages from `offset`, collecting counts and anomalies. Never throws on bad pages.
StreamSummary scan_stream(std::istream &in, uint64_t offset = kTafAudioOffset,
                          bool verify_checksums = true);

/// Playback duration in seconds: (last granule - pre-skip) / 48000, floored at zero.
double duration_seconds(const StreamSummary &summary, uint16_t pre_skip);

}  // namespace tafforge
