//
//  opus_stream.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "opus_stream.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "byte_order.hpp"
#include "logging.hpp"
#include "taf_errors.hpp"

namespace tafforge {

namespace {

constexpr char kOpusHeadMagic[] = "OpusHead";
constexpr char kOpusTagsMagic[] = "OpusTags";
constexpr size_t kMagicSize = 8;
constexpr size_t kOpusHeadMinSize = 19;

bool has_magic(const std::vector<uint8_t> &packet, const char *magic) {
    return packet.size() >= kMagicSize && std::memcmp(packet.data(), magic, kMagicSize) == 0;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

OggPage require_page(OggPageReader &reader, const char *what) {
    auto page = reader.next();
    if (!page) {
        throw StreamFormatError(std::string(what) + " page missing (" +
                                to_string(reader.stop_reason()) + " at offset " +
                                std::to_string(reader.position()) + ")");
    }
    return std::move(*page);
}

}  // namespace

std::optional<std::string> AudioStreamInfo::comment(const std::string &key) const {
    const std::string wanted = upper(key);
    for (const auto &kv : comments) {
        if (kv.first == wanted) {
            return kv.second;
        }
    }
    return std::nullopt;
}

OpusHead parse_opus_head(const std::vector<uint8_t> &packet) {
    if (!has_magic(packet, kOpusHeadMagic)) {
        throw StreamFormatError("first packet is not an OpusHead (starts with '" +
                                tag_to_string(packet.data(), std::min(packet.size(), kMagicSize)) +
                                "')");
    }
    if (packet.size() < kOpusHeadMinSize) {
        throw StreamFormatError("OpusHead too short: " + std::to_string(packet.size()) + " bytes");
    }
    OpusHead head;
    head.version = packet[8];
    head.channel_count = packet[9];
    head.pre_skip = load_u16_le(&packet[10]);
    head.input_sample_rate = load_u32_le(&packet[12]);
    head.output_gain = static_cast<int16_t>(load_u16_le(&packet[16]));
    head.mapping_family = packet[18];
    // Major version lives in the upper nibble; only 0 is decodable.
    if ((head.version & 0xF0) != 0) {
        throw StreamFormatError("unsupported OpusHead version " + std::to_string(head.version));
    }
    if (head.channel_count == 0) {
        throw StreamFormatError("OpusHead declares zero channels");
    }
    return head;
}

OpusTags parse_opus_tags(const std::vector<uint8_t> &packet) {
    if (!has_magic(packet, kOpusTagsMagic)) {
        throw StreamFormatError("second packet is not an OpusTags (starts with '" +
                                tag_to_string(packet.data(), std::min(packet.size(), kMagicSize)) +
                                "')");
    }
    size_t pos = kMagicSize;
    auto take_string = [&](std::string &dst) -> bool {
        if (pos + 4 > packet.size()) {
            return false;
        }
        const uint32_t len = load_u32_le(&packet[pos]);
        pos += 4;
        if (len > packet.size() - pos) {
            return false;
        }
        dst.assign(reinterpret_cast<const char *>(&packet[pos]), len);
        pos += len;
        return true;
    };

    OpusTags tags;
    if (!take_string(tags.vendor)) {
        throw StreamFormatError("OpusTags vendor string truncated");
    }
    if (pos + 4 > packet.size()) {
        TF_LOG("warn", "OpusTags ends after vendor string");
        return tags;
    }
    const uint32_t count = load_u32_le(&packet[pos]);
    pos += 4;
    for (uint32_t i = 0; i < count; ++i) {
        std::string entry;
        if (!take_string(entry)) {
            TF_LOG("warn", "OpusTags truncated after " << i << " of " << count << " comments");
            break;
        }
        const auto eq = entry.find('=');
        if (eq == std::string::npos) {
            TF_LOG("opus", "comment without '=' kept as key: " << entry);
            tags.comments.emplace_back(upper(entry), std::string());
            continue;
        }
        tags.comments.emplace_back(upper(entry.substr(0, eq)), entry.substr(eq + 1));
    }
    return tags;
}

AudioStreamInfo analyze_audio_stream(std::istream &in, uint64_t offset) {
    OggPageReader reader(in, offset);
    const OggPage first = require_page(reader, "stream-identification");
    const OggPage second = require_page(reader, "comments");

    const OpusHead head = parse_opus_head(first.payload);
    const OpusTags tags = parse_opus_tags(second.payload);

    AudioStreamInfo info;
    info.opus_version = head.version;
    info.channel_count = head.channel_count;
    info.sample_rate = head.input_sample_rate;
    info.pre_skip = head.pre_skip;
    info.output_gain = head.output_gain;
    info.mapping_family = head.mapping_family;
    info.stream_serial = first.stream_serial;
    info.serial_consistent = second.stream_serial == first.stream_serial;
    info.vendor = tags.vendor;
    info.comments = tags.comments;

    if (!first.is_begin_of_stream()) {
        TF_LOG("warn", "first page lacks the beginning-of-stream flag");
    }
    if (!info.serial_consistent) {
        TF_LOG("warn", "stream serial changes between the first two pages: "
                           << first.stream_serial << " vs " << second.stream_serial);
    }
    if (info.sample_rate != kOpusSampleRate) {
        TF_LOG("warn", "OpusHead input sample rate is " << info.sample_rate << ", expected "
                                                        << kOpusSampleRate);
    }
    TF_LOG("opus", "OpusHead v" << static_cast<int>(info.opus_version) << " channels="
                                << static_cast<int>(info.channel_count)
                                << " rate=" << info.sample_rate << " serial="
                                << info.stream_serial << " comments=" << info.comments.size());
    return info;
}

AudioStreamInfo analyze(const TafFile &file) {
    auto in = open_input(file);
    return analyze_audio_stream(in, TafFile::audio_region_offset);
}

StreamSummary scan_stream(std::istream &in, uint64_t offset, bool verify_checksums) {
    StreamSummary summary;
    OggPageReader reader(in, offset);
    std::optional<OggPage> previous;
    while (auto page = reader.next()) {
        const size_t index = summary.page_count;
        if (index == 0) {
            summary.stream_serial = page->stream_serial;
        } else {
            if (page->stream_serial != summary.stream_serial) {
                summary.serial_anomalies.push_back(index);
            }
            if (page->page_sequence_number != previous->page_sequence_number + 1) {
                summary.sequence_gaps.push_back(index);
            }
            // Every page but the last ends on a 4096-byte boundary of the audio region.
            const uint64_t prev_end = previous->offset + previous->page_size() - offset;
            if (prev_end % kTafPageAlignment != 0) {
                summary.unaligned_pages.push_back(index - 1);
            }
        }
        if (verify_checksums && !page->checksum_valid()) {
            summary.checksum_failures.push_back(index);
        }
        if (page->granule_position >= 0) {
            summary.last_granule = page->granule_position;
        }
        summary.audio_bytes += page->page_size();
        ++summary.page_count;
        previous = std::move(page);
    }
    summary.stop_reason = reader.stop_reason();
    if (!summary.serial_anomalies.empty()) {
        TF_LOG("warn", summary.serial_anomalies.size()
                           << " page(s) carry a different stream serial (multiplexed or "
                              "concatenated stream)");
    }
    if (!summary.checksum_failures.empty()) {
        TF_LOG("warn", summary.checksum_failures.size() << " page(s) fail checksum verification");
    }
    TF_LOG("ogg", "scanned " << summary.page_count << " pages, stop: "
                             << to_string(summary.stop_reason));
    return summary;
}

double duration_seconds(const StreamSummary &summary, uint16_t pre_skip) {
    if (summary.last_granule <= static_cast<int64_t>(pre_skip)) {
        return 0.0;
    }
    return static_cast<double>(summary.last_granule - pre_skip) / kOpusSampleRate;
}

}  // namespace tafforge
