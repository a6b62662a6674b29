//
//  taf_comparator.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tafforge {

/// Values of one field in file A and file B; std::nullopt where the file lacks the field.
struct FieldDiff {
    std::optional<std::string> value_a;
    std::optional<std::string> value_b;
};

using FieldDiffMap = std::map<std::string, FieldDiff>;

enum class PageSide { Both, OnlyA, OnlyB };

struct PageDiff {
    size_t page_index = 0;
    PageSide side = PageSide::Both;
    FieldDiffMap differing_fields;  ///< empty for OnlyA/OnlyB entries
};

struct OggPagesDiff {
    size_t total_pages_a = 0;
    size_t total_pages_b = 0;
    std::vector<PageDiff> page_differences;
    std::vector<size_t> checksum_failures_a;  ///< pages of A whose stored CRC is wrong
    std::vector<size_t> checksum_failures_b;
};

struct ComparisonResult {
    bool identical = false;
    int64_t file_size_diff = 0;          ///< size(B) - size(A)
    FieldDiffMap metadata_diff;          ///< header and comment fields
    FieldDiffMap audio_diff;             ///< stream properties
    std::optional<OggPagesDiff> ogg_pages_diff;  ///< only for detailed comparisons
    std::vector<std::string> errors;     ///< I/O and decode problems, human readable
};

struct CompareOptions {
    bool detailed = false;         ///< walk both page sequences
    bool verify_checksums = true;  ///< report pages whose CRC does not verify
};

/**
 * @brief Structural diff of two TAF files.
 *
 * Never throws for missing, unreadable or malformed files; those become `errors` entries and
 * force `identical == false`. Byte-identical files short-circuit to `identical == true` without
 * any page walk, so `ogg_pages_diff` stays empty for them even in detailed mode.
 */
ComparisonResult compare(const std::string &path_a, const std::string &path_b,
                         const CompareOptions &options);

ComparisonResult compare(const std::string &path_a, const std::string &path_b,
                         bool detailed = false);

const char *to_string(PageSide side);

}  // namespace tafforge
