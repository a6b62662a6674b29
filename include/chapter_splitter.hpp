//
//  chapter_splitter.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tafforge {

struct SplitOptions {
    bool mark_end_of_stream = true;  ///< flag the final page of every output as end-of-stream
};

/// Half-open page index range [first_page, end_page) of one chapter.
struct ChapterRange {
    size_t first_page = 0;
    size_t end_page = 0;

    size_t size() const { return end_page > first_page ? end_page - first_page : 0; }
};

/**
 * @brief Page ranges for each chapter.
 *
 * Always returns max(1, chapter_pages.size()) ranges. Entries beyond `total_pages` are clamped
 * to it and entries that do not ascend are raised to their predecessor; both are logged.
 */
std::vector<ChapterRange> chapter_ranges(const std::vector<uint32_t> &chapter_pages,
                                         size_t total_pages);

/// "01_story.opus" for chapter 1 of "some/dir/story.taf".
std::string chapter_file_name(size_t chapter_number, const std::string &source_path);

/**
 * @brief Split a TAF file into one standalone Ogg/Opus file per chapter.
 *
 * Each output starts with copies of the two stream-header pages, followed by the chapter's
 * pages renumbered from 2 (checksums recomputed where a header field changed). Granule positions
 * are kept. Outputs are written to temporary names and only renamed once every chapter succeeded;
 * on failure nothing is left behind.
 *
 * @return Output paths in chapter order.
 * @throws TafError when the file is missing or output cannot be written.
 * @throws HeaderDecodeError when the header region is malformed.
 * @throws StreamFormatError when there are no pages or no Opus stream headers.
 */
std::vector<std::string> split(const std::string &path, const std::string &output_dir,
                               const SplitOptions &options = {});

}  // namespace tafforge
