//
//  header_info.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "header_info.hpp"

#include "logging.hpp"
#include "taf_errors.hpp"
#include "taf_file.hpp"

namespace tafforge {

TafHeaderInfo read_header_info(const std::string &path) {
    const auto file = open_taf(path);
    if (!file) {
        throw TafError("file does not exist: " + path);
    }
    auto in = open_input(*file);

    TafHeaderInfo info;
    const HeaderReadResult hdr = read_header(in, file->total_size);
    info.header_size = hdr.header_length;
    info.header = hdr.header;
    info.file_size = file->total_size;
    info.audio_size = file->audio_size();
    info.sha1 = sha1_of_stream(in, TafFile::audio_region_offset);

    try {
        const AudioStreamInfo audio = analyze_audio_stream(in, TafFile::audio_region_offset);
        info.opus_found = true;
        info.opus_version = audio.opus_version;
        info.channel_count = audio.channel_count;
        info.sample_rate = audio.sample_rate;
        info.stream_serial = audio.stream_serial;
        info.pre_skip = audio.pre_skip;
        info.vendor = audio.vendor;
        info.comments = audio.comments;
    } catch (const StreamFormatError &e) {
        TF_LOG("info", path << ": no Opus stream: " << e.what());
        info.opus_error = e.what();
    }

    const StreamSummary stream = scan_stream(in, TafFile::audio_region_offset, false);
    info.page_count = stream.page_count;
    if (info.opus_found) {
        info.duration_seconds = duration_seconds(stream, info.pre_skip);
    }
    return info;
}

}  // namespace tafforge
