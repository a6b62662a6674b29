//
//  tonie_header.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tonie_header.hpp"

#include <algorithm>
#include <fstream>

#include "byte_order.hpp"
#include "logging.hpp"
#include "taf_errors.hpp"
#include "tonie_header.pb.h"

namespace tafforge {

namespace {

constexpr size_t kPaddingTagSize = 1;  // field 5, wire type 2

size_t varint_size(size_t v) {
    size_t n = 1;
    while (v >= 0x80) {
        v >>= 7;
        ++n;
    }
    return n;
}

pb::TonieHeader to_message(const TonieHeader &header) {
    pb::TonieHeader msg;
    const bool has_hash = std::any_of(header.audio_sha1.begin(), header.audio_sha1.end(),
                                      [](uint8_t b) { return b != 0; });
    if (has_hash) {
        msg.set_datahash(std::string(header.audio_sha1.begin(), header.audio_sha1.end()));
    }
    msg.set_datalength(header.data_length);
    msg.set_timestamp(header.timestamp);
    for (uint32_t page : header.chapter_pages) {
        msg.add_chapterpages(page);
    }
    return msg;
}

// Length of the padding bytes so tag + length varint + bytes fills `room` exactly.
bool padding_length_for(size_t room, size_t &length) {
    for (size_t vlen = 1; vlen <= 2; ++vlen) {
        if (room < kPaddingTagSize + vlen) {
            return false;
        }
        const size_t candidate = room - kPaddingTagSize - vlen;
        if (varint_size(candidate) == vlen) {
            length = candidate;
            return true;
        }
    }
    return false;
}

}  // namespace

std::vector<uint8_t> encode_header(const TonieHeader &header) {
    if (!chapter_pages_ascending(header.chapter_pages)) {
        TF_LOG("warn", "encoding chapter pages that are not strictly ascending ("
                           << header.chapter_pages.size() << " entries)");
    }
    pb::TonieHeader msg = to_message(header);
    const size_t base = msg.ByteSizeLong();
    if (base > kTafHeaderPayloadSize) {
        throw HeaderEncodeError("metadata needs " + std::to_string(base) + " bytes, only " +
                                std::to_string(kTafHeaderPayloadSize) + " available (" +
                                std::to_string(header.chapter_pages.size()) + " chapters)");
    }

    size_t padding = 0;
    const size_t room = kTafHeaderPayloadSize - base;
    if (room > 0 && padding_length_for(room, padding)) {
        msg.set_padding(std::string(padding, '\0'));
    } else if (room > 0) {
        // No padding field size lands exactly on the region end; trailing zeros fill the gap.
        TF_LOG("header", "padding field cannot fill " << room << " bytes, zero-filling instead");
    }

    std::vector<uint8_t> out(kTafHeaderPayloadSize, 0);
    const size_t encoded = msg.ByteSizeLong();
    if (encoded > out.size() ||
        !msg.SerializeToArray(out.data(), static_cast<int>(encoded))) {
        throw HeaderEncodeError("protobuf serialization failed");
    }
    TF_LOG("header", "encoded header: data_length=" << header.data_length
                                                    << " timestamp=" << header.timestamp
                                                    << " chapters=" << header.chapter_pages.size()
                                                    << " payload=" << base
                                                    << " padding=" << padding);
    return out;
}

TonieHeader decode_header(const uint8_t *data, size_t size) {
    pb::TonieHeader msg;
    bool ok = msg.ParseFromArray(data, static_cast<int>(size));
    if (!ok) {
        // Raw zero fill after the message (writers that skip the padding field). The last
        // field may itself end in zero bytes, so grow back from the last non-zero byte.
        size_t end = size;
        while (end > 0 && data[end - 1] == 0) {
            --end;
        }
        for (; !ok && end < size; ++end) {
            msg.Clear();
            ok = msg.ParseFromArray(data, static_cast<int>(end));
        }
        if (ok) {
            TF_LOG("header", "metadata zero-filled after " << end - 1 << " bytes");
        }
    }
    if (!ok) {
        throw HeaderDecodeError("malformed protobuf metadata", kTafLengthPrefixSize, size, size);
    }

    TonieHeader header;
    header.data_length = msg.datalength();
    header.timestamp = msg.timestamp();
    header.chapter_pages.assign(msg.chapterpages().begin(), msg.chapterpages().end());
    const std::string &hash = msg.datahash();
    if (!hash.empty() && hash.size() != kSha1Size) {
        TF_LOG("warn", "header hash has " << hash.size() << " bytes, expected " << kSha1Size);
    }
    std::copy_n(hash.begin(), std::min(hash.size(), kSha1Size), header.audio_sha1.begin());
    if (!chapter_pages_ascending(header.chapter_pages)) {
        TF_LOG("warn", "header chapter pages are not strictly ascending");
    }
    return header;
}

HeaderReadResult read_header(std::istream &in, uint64_t file_size) {
    if (file_size < kTafLengthPrefixSize) {
        throw HeaderDecodeError("file too short for the length prefix", 0, kTafLengthPrefixSize,
                                file_size);
    }
    in.clear();
    in.seekg(0);
    uint8_t prefix[kTafLengthPrefixSize];
    if (read_exact(in, prefix, sizeof(prefix)) != sizeof(prefix)) {
        throw HeaderDecodeError("length prefix unreadable", 0, kTafLengthPrefixSize, file_size);
    }

    HeaderReadResult result;
    result.header_length = load_u32_be(prefix);
    const uint64_t remaining = file_size - kTafLengthPrefixSize;
    if (result.header_length > remaining) {
        throw HeaderDecodeError("length prefix points past end of file", kTafLengthPrefixSize,
                                result.header_length, remaining);
    }
    if (result.header_length > kTafHeaderPayloadSize) {
        throw HeaderDecodeError("metadata overlaps the audio region at byte " +
                                    std::to_string(kTafAudioOffset),
                                kTafLengthPrefixSize, result.header_length, remaining);
    }
    if (result.header_length != kTafHeaderPayloadSize) {
        TF_LOG("warn", "non-conforming header length " << result.header_length << ", expected "
                                                      << kTafHeaderPayloadSize);
    }

    std::vector<uint8_t> payload(result.header_length);
    if (read_exact(in, payload.data(), payload.size()) != payload.size()) {
        throw HeaderDecodeError("metadata unreadable", kTafLengthPrefixSize,
                                result.header_length, remaining);
    }
    try {
        result.header = decode_header(payload.data(), payload.size());
    } catch (const HeaderDecodeError &) {
        throw HeaderDecodeError("malformed protobuf metadata", kTafLengthPrefixSize,
                                result.header_length, remaining);
    }
    return result;
}

bool write_header(std::ostream &out, const TonieHeader &header) {
    std::vector<uint8_t> region;
    region.reserve(kTafHeaderRegionSize);
    write_u32_be(region, kTafHeaderPayloadSize);
    const auto payload = encode_header(header);
    region.insert(region.end(), payload.begin(), payload.end());
    out.write(reinterpret_cast<const char *>(region.data()),
              static_cast<std::streamsize>(region.size()));
    return out.good();
}

void rewrite_header(const std::string &path, const TonieHeader &header) {
    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!f.is_open()) {
        throw TafError("cannot open " + path + " for header rewrite");
    }
    f.seekg(0, std::ios::end);
    const std::streamoff size = f.tellg();
    if (size < static_cast<std::streamoff>(kTafHeaderRegionSize)) {
        throw HeaderDecodeError("file too short for a header region", 0, kTafHeaderRegionSize,
                                size < 0 ? 0 : static_cast<uint64_t>(size));
    }
    f.seekp(0);
    if (!write_header(f, header)) {
        throw TafError("header rewrite failed for " + path);
    }
    f.flush();
    if (!f.good()) {
        throw TafError("header rewrite flush failed for " + path);
    }
    TF_LOG("info", "rewrote header of " << path);
}

bool chapter_pages_ascending(const std::vector<uint32_t> &pages) {
    for (size_t i = 1; i < pages.size(); ++i) {
        if (pages[i] <= pages[i - 1]) {
            return false;
        }
    }
    return true;
}

}  // namespace tafforge
