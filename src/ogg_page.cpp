//
//  ogg_page.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "ogg_page.hpp"

#include <algorithm>
#include <numeric>

#include <ogg/ogg.h>

#include "byte_order.hpp"
#include "logging.hpp"
#include "taf_errors.hpp"

namespace tafforge {

namespace {

constexpr size_t kChecksumFieldOffset = 22;

void append_header(std::vector<uint8_t> &out, const OggPage &page, uint32_t checksum) {
    out.insert(out.end(), page.capture_pattern.begin(), page.capture_pattern.end());
    write_u8(out, page.version);
    write_u8(out, page.header_type);
    write_u64_le(out, static_cast<uint64_t>(page.granule_position));
    write_u32_le(out, page.stream_serial);
    write_u32_le(out, page.page_sequence_number);
    write_u32_le(out, checksum);
    write_u8(out, static_cast<uint8_t>(page.segment_table.size()));
    out.insert(out.end(), page.segment_table.begin(), page.segment_table.end());
}

}  // namespace

uint32_t OggPage::compute_checksum() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(page_size());
    append_header(bytes, *this, 0);
    bytes.insert(bytes.end(), payload.begin(), payload.end());

    // libogg writes the CRC straight into the header copy.
    ogg_page view{};
    view.header = bytes.data();
    view.header_len = static_cast<long>(header_size());
    view.body = bytes.data() + header_size();
    view.body_len = static_cast<long>(payload.size());
    ogg_page_checksum_set(&view);
    return load_u32_le(bytes.data() + kChecksumFieldOffset);
}

std::vector<uint8_t> OggPage::serialize() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(page_size());
    append_header(bytes, *this, checksum);
    bytes.insert(bytes.end(), payload.begin(), payload.end());
    return bytes;
}

std::optional<OggPage> read_page(std::istream &in) {
    in.clear();
    const std::streamoff start = in.tellg();
    if (start < 0) {
        throw IncompleteReadError("ogg page header unreadable", 0, kOggPageHeaderSize, 0);
    }
    const uint64_t offset = static_cast<uint64_t>(start);

    uint8_t header[kOggPageHeaderSize];
    const size_t got = read_exact(in, header, kOggPageHeaderSize);
    if (got >= 4 && !std::equal(kOggCapturePattern.begin(), kOggCapturePattern.end(), header)) {
        TF_LOG("ogg", "no capture pattern, found '" << tag_to_string(header) << "' "
                                                    << hex_preview(header, got, offset));
        in.clear();
        in.seekg(start);
        return std::nullopt;
    }
    if (got < kOggPageHeaderSize) {
        throw IncompleteReadError("truncated ogg page header", offset, kOggPageHeaderSize, got);
    }

    OggPage page;
    page.offset = offset;
    std::copy(header, header + 4, page.capture_pattern.begin());
    page.version = header[4];
    page.header_type = header[5];
    page.granule_position = static_cast<int64_t>(load_u64_le(header + 6));
    page.stream_serial = load_u32_le(header + 14);
    page.page_sequence_number = load_u32_le(header + 18);
    page.checksum = load_u32_le(header + kChecksumFieldOffset);
    const size_t segment_count = header[26];

    page.segment_table.resize(segment_count);
    const size_t got_table = read_exact(in, page.segment_table.data(), segment_count);
    if (got_table < segment_count) {
        throw IncompleteReadError("truncated ogg segment table", offset + kOggPageHeaderSize,
                                  segment_count, got_table);
    }

    const size_t payload_size =
        std::accumulate(page.segment_table.begin(), page.segment_table.end(), size_t{0});
    page.payload.resize(payload_size);
    const size_t got_payload = read_exact(in, page.payload.data(), payload_size);
    if (got_payload < payload_size) {
        throw IncompleteReadError("truncated ogg page payload", offset + page.header_size(),
                                  payload_size, got_payload);
    }
    return page;
}

bool write_page(std::ostream &out, const OggPage &page) {
    const auto bytes = page.serialize();
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    return out.good();
}

OggPageReader::OggPageReader(std::istream &in, uint64_t offset) : in_(in), position_(offset) {}

std::optional<OggPage> OggPageReader::next() {
    if (stop_reason_ != StopReason::None) {
        return std::nullopt;
    }
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(position_));
    try {
        auto page = read_page(in_);
        if (!page) {
            stop_reason_ = StopReason::NoCapturePattern;
            return std::nullopt;
        }
        position_ += page->page_size();
        ++pages_read_;
        return page;
    } catch (const IncompleteReadError &e) {
        if (e.available() == 0 && e.offset() == position_) {
            stop_reason_ = StopReason::EndOfStream;
        } else {
            TF_LOG("ogg", "page " << pages_read_ << " ends the stream early: " << e.what());
            stop_reason_ = StopReason::Truncated;
        }
        return std::nullopt;
    }
}

const char *to_string(OggPageReader::StopReason reason) {
    switch (reason) {
        case OggPageReader::StopReason::None:
            return "none";
        case OggPageReader::StopReason::EndOfStream:
            return "end of stream";
        case OggPageReader::StopReason::NoCapturePattern:
            return "no capture pattern";
        case OggPageReader::StopReason::Truncated:
            return "truncated page";
    }
    return "unknown";
}

}  // namespace tafforge
