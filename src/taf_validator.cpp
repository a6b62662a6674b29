//
//  taf_validator.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "taf_validator.hpp"

#include <algorithm>
#include <sstream>

#include "logging.hpp"
#include "sha1_digest.hpp"
#include "taf_errors.hpp"
#include "taf_file.hpp"

namespace tafforge {

namespace {

void warn(ValidationReport &report, const std::string &msg) {
    TF_LOG("warn", msg);
    report.warnings.push_back(msg);
}

std::string describe_pages(const std::vector<size_t> &pages) {
    constexpr size_t kListLimit = 5;
    std::ostringstream oss;
    oss << pages.size() << " page(s): ";
    for (size_t i = 0; i < pages.size() && i < kListLimit; ++i) {
        oss << (i ? ", " : "") << pages[i];
    }
    if (pages.size() > kListLimit) {
        oss << ", ...";
    }
    return oss.str();
}

void check_stream(ValidationReport &report, const StreamSummary &stream,
                  const TonieHeader &header, const AudioStreamInfo &audio) {
    if (!stream.ended_cleanly()) {
        warn(report, std::string("page sequence ends early: ") + to_string(stream.stop_reason) +
                         " after " + std::to_string(stream.page_count) + " pages");
    }
    if (!stream.checksum_failures.empty()) {
        warn(report, "checksum mismatch on " + describe_pages(stream.checksum_failures));
    }
    if (!stream.serial_anomalies.empty()) {
        warn(report, "stream serial differs on " + describe_pages(stream.serial_anomalies));
    }
    if (!stream.sequence_gaps.empty()) {
        warn(report, "page sequence gap before " + describe_pages(stream.sequence_gaps));
    }
    if (!stream.unaligned_pages.empty()) {
        warn(report, "not 4096-aligned: " + describe_pages(stream.unaligned_pages));
    }
    if (header.timestamp != audio.stream_serial) {
        warn(report, "header timestamp " + std::to_string(header.timestamp) +
                         " differs from stream serial " + std::to_string(audio.stream_serial));
    }
    if (!chapter_pages_ascending(header.chapter_pages)) {
        warn(report, "chapter pages are not strictly ascending");
    }
    const auto beyond =
        std::count_if(header.chapter_pages.begin(), header.chapter_pages.end(),
                      [&](uint32_t p) { return p >= stream.page_count; });
    if (beyond > 0) {
        warn(report, std::to_string(beyond) + " chapter page(s) beyond the " +
                         std::to_string(stream.page_count) + " pages of the stream");
    }
}

}  // namespace

const char *to_string(ValidationStage stage) {
    switch (stage) {
        case ValidationStage::Missing:
            return "missing";
        case ValidationStage::Header:
            return "header";
        case ValidationStage::DataLength:
            return "data length";
        case ValidationStage::AudioStream:
            return "audio stream";
        case ValidationStage::Complete:
            return "complete";
    }
    return "unknown";
}

ValidationReport validate_file(const std::string &path, const ValidationOptions &options) {
    ValidationReport report;
    const auto file = open_taf(path);
    if (!file) {
        report.message = "file does not exist: " + path;
        return report;
    }
    report.file_size = file->total_size;

    report.stage = ValidationStage::Header;
    if (file->total_size < TafFile::header_region_size) {
        throw HeaderDecodeError(path + " is shorter than the header region", 0,
                                TafFile::header_region_size, file->total_size);
    }
    auto in = open_input(*file);
    report.header = read_header(in, file->total_size);
    const TonieHeader &header = report.header->header;

    report.stage = ValidationStage::DataLength;
    const uint64_t audio_size = file->audio_size();
    const uint64_t diff = header.data_length > audio_size ? header.data_length - audio_size
                                                          : audio_size - header.data_length;
    if (diff > options.data_length_tolerance) {
        throw HeaderDecodeError("declared data length " + std::to_string(header.data_length) +
                                    " does not match audio region of " +
                                    std::to_string(audio_size) + " bytes",
                                kTafLengthPrefixSize, header.data_length, audio_size);
    }
    if (diff != 0) {
        warn(report, "declared data length " + std::to_string(header.data_length) +
                         " differs from audio region size " + std::to_string(audio_size));
    }

    report.stage = ValidationStage::AudioStream;
    report.audio = analyze_audio_stream(in, TafFile::audio_region_offset);
    report.stream = scan_stream(in, TafFile::audio_region_offset, options.verify_checksums);
    check_stream(report, *report.stream, header, *report.audio);

    if (options.verify_audio_hash) {
        const Sha1Digest actual = sha1_of_stream(in, TafFile::audio_region_offset);
        if (actual != header.audio_sha1) {
            warn(report, "audio SHA-1 " + to_hex(actual) + " does not match header " +
                             to_hex(header.audio_sha1));
        }
    }

    report.stage = ValidationStage::Complete;
    report.valid = true;
    TF_LOG("info", "validated " << path << " (" << report.warnings.size() << " warning(s))");
    return report;
}

bool check_valid(const std::string &path) { return validate_file(path).valid; }

}  // namespace tafforge
