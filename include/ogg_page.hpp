//
//  ogg_page.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

namespace tafforge {

inline constexpr size_t kOggPageHeaderSize = 27;  // fixed part, up to and including segment count
inline constexpr uint8_t kOggFlagContinued = 0x01;
inline constexpr uint8_t kOggFlagBeginOfStream = 0x02;
inline constexpr uint8_t kOggFlagEndOfStream = 0x04;
inline constexpr std::array<uint8_t, 4> kOggCapturePattern = {'O', 'g', 'g', 'S'};

/**
 * @brief One physical Ogg page.
 *
 * Plain value type; `offset` records where the page started in its source and is not part of
 * the serialized form.
 */
struct OggPage {
    std::array<uint8_t, 4> capture_pattern = kOggCapturePattern;
    uint8_t version = 0;
    uint8_t header_type = 0;
    int64_t granule_position = 0;
    uint32_t stream_serial = 0;
    uint32_t page_sequence_number = 0;
    uint32_t checksum = 0;
    std::vector<uint8_t> segment_table;
    std::vector<uint8_t> payload;

    uint64_t offset = 0;

    size_t segment_count() const { return segment_table.size(); }
    size_t header_size() const { return kOggPageHeaderSize + segment_table.size(); }
    size_t page_size() const { return header_size() + payload.size(); }

    bool is_continued() const { return (header_type & kOggFlagContinued) != 0; }
    bool is_begin_of_stream() const { return (header_type & kOggFlagBeginOfStream) != 0; }
    bool is_end_of_stream() const { return (header_type & kOggFlagEndOfStream) != 0; }
    bool has_capture_pattern() const { return capture_pattern == kOggCapturePattern; }

    // Ogg CRC-32 (libogg) over the serialized page with the checksum field zeroed.
    uint32_t compute_checksum() const;
    bool checksum_valid() const { return compute_checksum() == checksum; }
    void update_checksum() { checksum = compute_checksum(); }

    // Serialized page bytes (header, segment table, payload) using the stored checksum.
    std::vector<uint8_t> serialize() const;
};

/**
 * @brief Parse one page at the current stream position.
 *
 * Returns std::nullopt when the capture pattern does not match; the stream is then left at the
 * page start. Throws IncompleteReadError when the stream ends inside the fixed header, the
 * segment table or the payload.
 */
std::optional<OggPage> read_page(std::istream &in);

// Write the serialized page to out. Returns false on stream failure.
bool write_page(std::ostream &out, const OggPage &page);

/**
 * @brief Lazy, forward-only page iteration starting at a byte offset.
 *
 * Yields pages until end-of-stream, the first capture-pattern mismatch, or the first truncated
 * page; all three end the sequence without throwing. `stop_reason()` tells the caller which one
 * it was so it can decide whether that is acceptable.
 */
class OggPageReader {
   public:
    enum class StopReason { None, EndOfStream, NoCapturePattern, Truncated };

    OggPageReader(std::istream &in, uint64_t offset);

    std::optional<OggPage> next();

    size_t pages_read() const { return pages_read_; }
    StopReason stop_reason() const { return stop_reason_; }
    uint64_t position() const { return position_; }

   private:
    std::istream &in_;
    uint64_t position_;
    size_t pages_read_ = 0;
    StopReason stop_reason_ = StopReason::None;
};

const char *to_string(OggPageReader::StopReason reason);

}  // namespace tafforge
