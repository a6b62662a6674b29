//
//  report_json.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "report_json.hpp"

#include "sha1_digest.hpp"

using json = nlohmann::json;

namespace tafforge {

namespace {

json header_json(const TonieHeader &header) {
    json j;
    j["data_length"] = header.data_length;
    j["timestamp"] = header.timestamp;
    j["chapter_pages"] = header.chapter_pages;
    j["sha1"] = to_hex(header.audio_sha1);
    return j;
}

json comments_json(const std::vector<std::pair<std::string, std::string>> &comments) {
    json arr = json::array();
    for (const auto &kv : comments) {
        arr.push_back(json{{"key", kv.first}, {"value", kv.second}});
    }
    return arr;
}

json field_diffs_json(const FieldDiffMap &diffs) {
    json j = json::object();
    for (const auto &kv : diffs) {
        json d;
        d["a"] = kv.second.value_a ? json(*kv.second.value_a) : json(nullptr);
        d["b"] = kv.second.value_b ? json(*kv.second.value_b) : json(nullptr);
        j[kv.first] = d;
    }
    return j;
}

}  // namespace

json to_json(const TafHeaderInfo &info) {
    json j;
    j["header_size"] = info.header_size;
    j["header"] = header_json(info.header);
    j["file_size"] = info.file_size;
    j["audio_size"] = info.audio_size;
    j["sha1"] = to_hex(info.sha1);
    j["sha1_matches_header"] = info.sha1 == info.header.audio_sha1;
    j["opus_found"] = info.opus_found;
    if (info.opus_found) {
        j["opus_version"] = info.opus_version;
        j["channel_count"] = info.channel_count;
        j["sample_rate"] = info.sample_rate;
        j["stream_serial"] = info.stream_serial;
        j["pre_skip"] = info.pre_skip;
        j["vendor"] = info.vendor;
        j["comments"] = comments_json(info.comments);
        j["duration_seconds"] = info.duration_seconds;
    } else if (info.opus_error) {
        j["opus_error"] = *info.opus_error;
    }
    j["page_count"] = info.page_count;
    return j;
}

json to_json(const ValidationReport &report) {
    json j;
    j["valid"] = report.valid;
    j["stage"] = to_string(report.stage);
    if (!report.message.empty()) {
        j["message"] = report.message;
    }
    j["warnings"] = report.warnings;
    j["file_size"] = report.file_size;
    if (report.header) {
        j["header_size"] = report.header->header_length;
        j["header"] = header_json(report.header->header);
    }
    if (report.audio) {
        j["channel_count"] = report.audio->channel_count;
        j["sample_rate"] = report.audio->sample_rate;
        j["stream_serial"] = report.audio->stream_serial;
    }
    if (report.stream) {
        j["page_count"] = report.stream->page_count;
    }
    return j;
}

json to_json(const ComparisonResult &result) {
    json j;
    j["identical"] = result.identical;
    j["file_size_diff"] = result.file_size_diff;
    j["metadata_diff"] = field_diffs_json(result.metadata_diff);
    j["audio_diff"] = field_diffs_json(result.audio_diff);
    j["errors"] = result.errors;
    if (result.ogg_pages_diff) {
        const auto &pages = *result.ogg_pages_diff;
        json p;
        p["total_pages_a"] = pages.total_pages_a;
        p["total_pages_b"] = pages.total_pages_b;
        json diffs = json::array();
        for (const auto &d : pages.page_differences) {
            json e;
            e["page_index"] = d.page_index;
            if (d.side == PageSide::Both) {
                e["differences"] = field_diffs_json(d.differing_fields);
            } else {
                e["only_in"] = to_string(d.side);
            }
            diffs.push_back(e);
        }
        p["page_differences"] = diffs;
        p["checksum_failures_a"] = pages.checksum_failures_a;
        p["checksum_failures_b"] = pages.checksum_failures_b;
        j["ogg_pages_diff"] = p;
    }
    return j;
}

std::string render(const json &j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

}  // namespace tafforge
