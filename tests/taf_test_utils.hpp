//
//  taf_test_utils.hpp
//  TafForge
//
//  Test-only helpers that synthesize Ogg pages, Opus packets and TAF files. Page CRCs and the
//  header's protobuf bytes are encoded here independently of the library code to avoid
//  self-consistency bugs.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "sha1_digest.hpp"

namespace taf_test_utils {

inline void put_u16_le(std::vector<uint8_t> &buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

inline void put_u32_le(std::vector<uint8_t> &buf, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

inline void put_u64_le(std::vector<uint8_t> &buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

inline void put_u32_be(std::vector<uint8_t> &buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline uint32_t get_u32_le(const std::vector<uint8_t> &buf, size_t pos) {
    return uint32_t(buf[pos]) | (uint32_t(buf[pos + 1]) << 8) | (uint32_t(buf[pos + 2]) << 16) |
           (uint32_t(buf[pos + 3]) << 24);
}

// Bitwise Ogg CRC (poly 0x04C11DB7, init 0, unreflected).
inline uint32_t slow_ogg_crc(const std::vector<uint8_t> &data) {
    uint32_t crc = 0;
    for (uint8_t byte : data) {
        crc ^= uint32_t(byte) << 24;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 0x80000000u) ? ((crc << 1) ^ 0x04C11DB7u) : (crc << 1);
        }
    }
    return crc;
}

// One page holding one packet; checksum filled in unless `valid_crc` is false.
inline std::vector<uint8_t> make_page(uint8_t header_type, int64_t granule, uint32_t serial,
                                      uint32_t sequence, const std::vector<uint8_t> &packet,
                                      bool valid_crc = true) {
    std::vector<uint8_t> page = {'O', 'g', 'g', 'S', 0, header_type};
    put_u64_le(page, static_cast<uint64_t>(granule));
    put_u32_le(page, serial);
    put_u32_le(page, sequence);
    put_u32_le(page, 0);  // checksum placeholder
    std::vector<uint8_t> lacing(packet.size() / 255, 255);
    lacing.push_back(static_cast<uint8_t>(packet.size() % 255));
    page.push_back(static_cast<uint8_t>(lacing.size()));
    page.insert(page.end(), lacing.begin(), lacing.end());
    page.insert(page.end(), packet.begin(), packet.end());
    uint32_t crc = slow_ogg_crc(page);
    if (!valid_crc) {
        crc ^= 0xDEADBEEF;
    }
    for (int i = 0; i < 4; ++i) {
        page[22 + i] = static_cast<uint8_t>((crc >> (8 * i)) & 0xFF);
    }
    return page;
}

inline std::vector<uint8_t> opus_head_packet(uint8_t channels, uint32_t sample_rate,
                                             uint16_t pre_skip = 312) {
    std::vector<uint8_t> p = {'O', 'p', 'u', 's', 'H', 'e', 'a', 'd', 1, channels};
    put_u16_le(p, pre_skip);
    put_u32_le(p, sample_rate);
    put_u16_le(p, 0);  // output gain
    p.push_back(0);    // mapping family
    return p;
}

inline std::vector<uint8_t> opus_tags_packet(
    const std::string &vendor, const std::vector<std::string> &comments) {
    std::vector<uint8_t> p = {'O', 'p', 'u', 's', 'T', 'a', 'g', 's'};
    put_u32_le(p, static_cast<uint32_t>(vendor.size()));
    p.insert(p.end(), vendor.begin(), vendor.end());
    put_u32_le(p, static_cast<uint32_t>(comments.size()));
    for (const auto &c : comments) {
        put_u32_le(p, static_cast<uint32_t>(c.size()));
        p.insert(p.end(), c.begin(), c.end());
    }
    return p;
}

// ------------- Minimal protobuf wire encoding ------------------------------

inline void put_varint(std::vector<uint8_t> &buf, uint64_t v) {
    while (v >= 0x80) {
        buf.push_back(static_cast<uint8_t>((v & 0x7F) | 0x80));
        v >>= 7;
    }
    buf.push_back(static_cast<uint8_t>(v));
}

inline void put_bytes_field(std::vector<uint8_t> &buf, uint32_t field,
                            const std::vector<uint8_t> &bytes) {
    put_varint(buf, (uint64_t(field) << 3) | 2);
    put_varint(buf, bytes.size());
    buf.insert(buf.end(), bytes.begin(), bytes.end());
}

inline void put_varint_field(std::vector<uint8_t> &buf, uint32_t field, uint64_t v) {
    put_varint(buf, uint64_t(field) << 3);
    put_varint(buf, v);
}

struct HeaderFields {
    std::vector<uint8_t> hash;
    uint64_t data_length = 0;
    uint32_t timestamp = 0;
    std::vector<uint32_t> chapter_pages;
    std::vector<std::pair<uint32_t, uint64_t>> extra_varint_fields;  // unknown fields
};

// Protobuf message bytes without padding.
inline std::vector<uint8_t> encode_header_fields(const HeaderFields &h) {
    std::vector<uint8_t> msg;
    if (!h.hash.empty()) {
        put_bytes_field(msg, 1, h.hash);
    }
    if (h.data_length != 0) {
        put_varint_field(msg, 2, h.data_length);
    }
    if (h.timestamp != 0) {
        put_varint_field(msg, 3, h.timestamp);
    }
    if (!h.chapter_pages.empty()) {
        std::vector<uint8_t> packed;
        for (uint32_t p : h.chapter_pages) {
            put_varint(packed, p);
        }
        put_bytes_field(msg, 4, packed);
    }
    for (const auto &f : h.extra_varint_fields) {
        put_varint_field(msg, f.first, f.second);
    }
    return msg;
}

// 4096-byte header region: BE length 4092 + message + padding field (field 5).
inline std::vector<uint8_t> make_header_region(const HeaderFields &h) {
    std::vector<uint8_t> msg = encode_header_fields(h);
    const size_t room = 4092 - msg.size();
    // Tag (1) + 2-byte length varint for the sizes used in tests.
    std::vector<uint8_t> padding(room - 3, 0);
    put_bytes_field(msg, 5, padding);
    std::vector<uint8_t> region;
    put_u32_be(region, 4092);
    region.insert(region.end(), msg.begin(), msg.end());
    return region;
}

// ------------- Whole-file fixtures ------------------------------------------

struct TafFixture {
    uint32_t serial = 0x1234ABCD;
    uint8_t channels = 2;
    uint32_t sample_rate = 48000;
    size_t total_pages = 10;      // including the two stream-header pages
    size_t audio_packet_size = 100;
    std::vector<uint32_t> chapter_pages = {0};
    std::vector<std::string> comments = {"title=Fixture", "ARTIST=Tests"};
    uint8_t audio_fill = 0x5A;    // varies payload bytes between fixtures
    bool correct_hash = true;
    int64_t data_length_delta = 0;
    bool page_aligned = false;    // every page but the last exactly 4096 bytes
    size_t last_packet_size = 0;  // 0: same as audio_packet_size
};

// 27-byte header + lacing + payload for a one-packet page.
inline size_t page_size_for_packet(size_t packet_size) {
    return 28 + packet_size / 255 + packet_size;
}

inline constexpr size_t kAlignedPacketSize = 4053;  // page_size_for_packet(4053) == 4096

inline std::vector<uint8_t> make_audio_stream(const TafFixture &f) {
    std::vector<uint8_t> audio;
    auto append = [&](const std::vector<uint8_t> &page) {
        audio.insert(audio.end(), page.begin(), page.end());
    };
    auto head = opus_head_packet(f.channels, f.sample_rate);
    auto tags = opus_tags_packet("tafforge-tests", f.comments);
    if (f.page_aligned) {
        head.resize(kAlignedPacketSize, 0);
        tags.resize(kAlignedPacketSize, 0);
    }
    append(make_page(0x02, 0, f.serial, 0, head));
    append(make_page(0x00, 0, f.serial, 1, tags));
    for (size_t i = 2; i < f.total_pages; ++i) {
        const bool last = i + 1 == f.total_pages;
        size_t size = f.audio_packet_size;
        if (last && f.last_packet_size != 0) {
            size = f.last_packet_size;
        } else if (!last && f.page_aligned) {
            size = kAlignedPacketSize;
        }
        std::vector<uint8_t> packet(size, f.audio_fill);
        packet[0] = static_cast<uint8_t>(i & 0xFF);
        const uint8_t flags = last ? 0x04 : 0x00;
        append(make_page(flags, static_cast<int64_t>((i - 1) * 960), f.serial,
                         static_cast<uint32_t>(i), packet));
    }
    return audio;
}

inline std::vector<uint8_t> make_taf(const TafFixture &f) {
    const std::vector<uint8_t> audio = make_audio_stream(f);
    HeaderFields h;
    if (f.correct_hash) {
        const auto digest = tafforge::sha1_of(audio);
        h.hash.assign(digest.begin(), digest.end());
    }
    h.data_length = static_cast<uint64_t>(static_cast<int64_t>(audio.size()) + f.data_length_delta);
    h.timestamp = f.serial;
    h.chapter_pages = f.chapter_pages;
    std::vector<uint8_t> file = make_header_region(h);
    file.insert(file.end(), audio.begin(), audio.end());
    return file;
}

// make_taf() with the last audio packet sized so the file is exactly `total_size` bytes.
// Returns an empty vector when no single-packet last page can reach that size.
inline std::vector<uint8_t> make_taf_of_size(TafFixture f, size_t total_size) {
    f.last_packet_size = 0;
    const size_t base = make_audio_stream(f).size() - page_size_for_packet(f.audio_packet_size);
    if (total_size < 4096 + base + 28) {
        return {};
    }
    const size_t want = total_size - 4096 - base;
    for (size_t p = want - 28 + 1; p-- > 1;) {
        if (page_size_for_packet(p) == want) {
            f.last_packet_size = p;
            return make_taf(f);
        }
    }
    return {};
}

inline std::filesystem::path write_temp_file(const std::vector<uint8_t> &data,
                                             const std::string &name) {
    auto tmp = std::filesystem::temp_directory_path() / name;
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return tmp;
}

inline std::vector<uint8_t> read_file(const std::filesystem::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
}

// Fresh, empty scratch directory under the temp dir.
inline std::filesystem::path scratch_dir(const std::string &name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace taf_test_utils
