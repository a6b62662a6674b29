//
//  taf_comparator.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "taf_comparator.hpp"

#include <exception>
#include <iomanip>
#include <sstream>

#include "header_info.hpp"
#include "logging.hpp"
#include "ogg_page.hpp"
#include "sha1_digest.hpp"
#include "taf_errors.hpp"
#include "taf_file.hpp"

namespace tafforge {

namespace {

constexpr char kMissingFiles[] = "One or both files do not exist";

template <typename T>
std::string str(const T &v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

std::string join(const std::vector<uint32_t> &values) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        oss << (i ? "," : "") << values[i];
    }
    oss << ']';
    return oss.str();
}

std::string seconds(double s) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << s;
    return oss.str();
}

void add_if_different(FieldDiffMap &diffs, const std::string &field,
                      const std::optional<std::string> &a, const std::optional<std::string> &b) {
    if (a != b) {
        diffs[field] = FieldDiff{a, b};
    }
}

// Comment values keyed by tag; repeated tags are joined in stream order.
std::map<std::string, std::string> comment_map(const TafHeaderInfo &info) {
    std::map<std::string, std::string> out;
    for (const auto &kv : info.comments) {
        auto it = out.find(kv.first);
        if (it == out.end()) {
            out.emplace(kv.first, kv.second);
        } else {
            it->second += "; " + kv.second;
        }
    }
    return out;
}

void diff_metadata(const TafHeaderInfo &a, const TafHeaderInfo &b, FieldDiffMap &out) {
    add_if_different(out, "header_size", str(a.header_size), str(b.header_size));
    add_if_different(out, "data_length", str(a.header.data_length), str(b.header.data_length));
    add_if_different(out, "timestamp", str(a.header.timestamp), str(b.header.timestamp));
    add_if_different(out, "chapter_count", str(a.header.chapter_pages.size()),
                     str(b.header.chapter_pages.size()));
    add_if_different(out, "chapter_pages", join(a.header.chapter_pages),
                     join(b.header.chapter_pages));
    add_if_different(out, "header_sha1", to_hex(a.header.audio_sha1), to_hex(b.header.audio_sha1));

    if (a.opus_found && b.opus_found) {
        add_if_different(out, "vendor", a.vendor, b.vendor);
    }
    const auto ca = comment_map(a);
    const auto cb = comment_map(b);
    std::map<std::string, FieldDiff> merged;
    for (const auto &kv : ca) {
        merged[kv.first].value_a = kv.second;
    }
    for (const auto &kv : cb) {
        merged[kv.first].value_b = kv.second;
    }
    for (const auto &kv : merged) {
        add_if_different(out, "comment:" + kv.first, kv.second.value_a, kv.second.value_b);
    }
}

void diff_audio(const TafHeaderInfo &a, const TafHeaderInfo &b, FieldDiffMap &out) {
    add_if_different(out, "opus_found", std::string(a.opus_found ? "true" : "false"),
                     std::string(b.opus_found ? "true" : "false"));
    add_if_different(out, "audio_size", str(a.audio_size), str(b.audio_size));
    add_if_different(out, "audio_sha1", to_hex(a.sha1), to_hex(b.sha1));
    add_if_different(out, "page_count", str(a.page_count), str(b.page_count));
    auto opus_field = [](const TafHeaderInfo &i, const std::string &v) {
        return i.opus_found ? std::optional<std::string>(v) : std::nullopt;
    };
    add_if_different(out, "opus_version", opus_field(a, str(int(a.opus_version))),
                     opus_field(b, str(int(b.opus_version))));
    add_if_different(out, "channel_count", opus_field(a, str(int(a.channel_count))),
                     opus_field(b, str(int(b.channel_count))));
    add_if_different(out, "sample_rate", opus_field(a, str(a.sample_rate)),
                     opus_field(b, str(b.sample_rate)));
    add_if_different(out, "stream_serial", opus_field(a, str(a.stream_serial)),
                     opus_field(b, str(b.stream_serial)));
    add_if_different(out, "pre_skip", opus_field(a, str(a.pre_skip)),
                     opus_field(b, str(b.pre_skip)));
    add_if_different(out, "duration", opus_field(a, seconds(a.duration_seconds)),
                     opus_field(b, seconds(b.duration_seconds)));
}

FieldDiffMap diff_page(const OggPage &a, const OggPage &b) {
    FieldDiffMap out;
    add_if_different(out, "page_sequence_number", str(a.page_sequence_number),
                     str(b.page_sequence_number));
    add_if_different(out, "granule_position", str(a.granule_position), str(b.granule_position));
    add_if_different(out, "stream_serial", str(a.stream_serial), str(b.stream_serial));
    add_if_different(out, "header_type", str(int(a.header_type)), str(int(b.header_type)));
    add_if_different(out, "segment_count", str(a.segment_count()), str(b.segment_count()));
    add_if_different(out, "page_size", str(a.page_size()), str(b.page_size()));
    add_if_different(out, "checksum", str(a.checksum), str(b.checksum));
    return out;
}

OggPagesDiff diff_pages(const TafFile &fa, const TafFile &fb, bool verify_checksums) {
    auto in_a = open_input(fa);
    auto in_b = open_input(fb);
    OggPageReader ra(in_a, TafFile::audio_region_offset);
    OggPageReader rb(in_b, TafFile::audio_region_offset);

    OggPagesDiff out;
    auto page_a = ra.next();
    auto page_b = rb.next();
    size_t index = 0;
    while (page_a || page_b) {
        if (verify_checksums && page_a && !page_a->checksum_valid()) {
            out.checksum_failures_a.push_back(index);
        }
        if (verify_checksums && page_b && !page_b->checksum_valid()) {
            out.checksum_failures_b.push_back(index);
        }
        if (page_a && page_b) {
            auto fields = diff_page(*page_a, *page_b);
            if (!fields.empty()) {
                out.page_differences.push_back(PageDiff{index, PageSide::Both, std::move(fields)});
            }
        } else {
            out.page_differences.push_back(
                PageDiff{index, page_a ? PageSide::OnlyA : PageSide::OnlyB, {}});
        }
        if (page_a) {
            page_a = ra.next();
        }
        if (page_b) {
            page_b = rb.next();
        }
        ++index;
    }
    out.total_pages_a = ra.pages_read();
    out.total_pages_b = rb.pages_read();
    TF_LOG("compare", "page diff: A=" << out.total_pages_a << " B=" << out.total_pages_b
                                      << " differences=" << out.page_differences.size());
    return out;
}

std::optional<TafHeaderInfo> load_info(const std::string &label, const std::string &path,
                                       ComparisonResult &result) {
    try {
        return read_header_info(path);
    } catch (const std::exception &e) {
        TF_LOG("warn", "compare: file " << label << " (" << path << "): " << e.what());
        result.errors.push_back("file " + label + " (" + path + "): " + e.what());
        return std::nullopt;
    }
}

}  // namespace

const char *to_string(PageSide side) {
    switch (side) {
        case PageSide::Both:
            return "both";
        case PageSide::OnlyA:
            return "A";
        case PageSide::OnlyB:
            return "B";
    }
    return "unknown";
}

ComparisonResult compare(const std::string &path_a, const std::string &path_b,
                         const CompareOptions &options) {
    ComparisonResult result;
    const auto fa = open_taf(path_a);
    const auto fb = open_taf(path_b);
    const uint64_t size_a = fa ? fa->total_size : 0;
    const uint64_t size_b = fb ? fb->total_size : 0;
    result.file_size_diff = static_cast<int64_t>(size_b) - static_cast<int64_t>(size_a);
    if (!fa || !fb) {
        result.errors.push_back(kMissingFiles);
        if (!fa) {
            result.errors.push_back("missing: " + path_a);
        }
        if (!fb) {
            result.errors.push_back("missing: " + path_b);
        }
        TF_LOG("warn", "compare: " << kMissingFiles << " (" << path_a << ", " << path_b << ")");
        return result;
    }

    try {
        if (size_a == size_b) {
            auto in_a = open_input(*fa);
            auto in_b = open_input(*fb);
            if (sha1_of_stream(in_a, 0) == sha1_of_stream(in_b, 0)) {
                TF_LOG("compare", "byte-identical: " << path_a << " == " << path_b);
                result.identical = true;
                return result;
            }
        }
    } catch (const TafError &e) {
        result.errors.push_back(std::string("content hash failed: ") + e.what());
        return result;
    }

    const auto info_a = load_info("A", path_a, result);
    const auto info_b = load_info("B", path_b, result);
    if (info_a && info_b) {
        diff_metadata(*info_a, *info_b, result.metadata_diff);
        diff_audio(*info_a, *info_b, result.audio_diff);
    }

    if (options.detailed) {
        try {
            result.ogg_pages_diff = diff_pages(*fa, *fb, options.verify_checksums);
        } catch (const TafError &e) {
            result.errors.push_back(std::string("page comparison failed: ") + e.what());
        }
    }

    const bool pages_equal =
        !result.ogg_pages_diff || result.ogg_pages_diff->page_differences.empty();
    result.identical = result.errors.empty() && result.file_size_diff == 0 &&
                       result.metadata_diff.empty() && result.audio_diff.empty() && pages_equal;
    TF_LOG("info", "compare " << path_a << " vs " << path_b << ": "
                              << (result.identical ? "identical" : "different")
                              << " metadata=" << result.metadata_diff.size()
                              << " audio=" << result.audio_diff.size()
                              << " errors=" << result.errors.size());
    return result;
}

ComparisonResult compare(const std::string &path_a, const std::string &path_b, bool detailed) {
    CompareOptions options;
    options.detailed = detailed;
    return compare(path_a, path_b, options);
}

}  // namespace tafforge
