//
//  chapter_splitter.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "chapter_splitter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "ogg_page.hpp"
#include "opus_stream.hpp"
#include "taf_errors.hpp"
#include "taf_file.hpp"
#include "tonie_header.hpp"

namespace tafforge {

namespace {

constexpr size_t kStreamHeaderPages = 2;  // OpusHead + OpusTags
constexpr char kPartialSuffix[] = ".part";

// Removes every tracked file on destruction unless released.
class OutputGuard {
   public:
    OutputGuard() = default;
    OutputGuard(const OutputGuard &) = delete;
    OutputGuard &operator=(const OutputGuard &) = delete;
    ~OutputGuard() {
        for (const auto &p : paths_) {
            std::error_code ec;
            std::filesystem::remove(p, ec);
            if (ec) {
                TF_LOG("warn", "could not remove partial output " << p.string() << ": "
                                                                  << ec.message());
            }
        }
    }

    void track(const std::filesystem::path &p) { paths_.push_back(p); }
    void release() { paths_.clear(); }

   private:
    std::vector<std::filesystem::path> paths_;
};

// Writes one output stream, renumbering pages after the two header pages.
class ChapterWriter {
   public:
    ChapterWriter(const std::filesystem::path &path, const std::vector<OggPage> &header_pages)
        : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
        if (!out_.is_open()) {
            throw TafError("cannot create " + path.string());
        }
        pending_ = header_pages;
        for (size_t i = 0; i < pending_.size(); ++i) {
            renumber(pending_[i], static_cast<uint32_t>(i));
        }
        next_sequence_ = static_cast<uint32_t>(pending_.size());
    }

    void add(OggPage page) {
        renumber(page, next_sequence_++);
        if (page.is_begin_of_stream()) {
            page.header_type &= static_cast<uint8_t>(~kOggFlagBeginOfStream);
            page.update_checksum();
        }
        pending_.push_back(std::move(page));
        // Keep one page back so the last one can still be flagged.
        while (pending_.size() > 1) {
            emit(pending_.front());
            pending_.erase(pending_.begin());
        }
    }

    size_t finish(bool mark_end_of_stream) {
        if (!pending_.empty() && mark_end_of_stream && !pending_.back().is_end_of_stream()) {
            pending_.back().header_type |= kOggFlagEndOfStream;
            pending_.back().update_checksum();
        }
        for (const auto &page : pending_) {
            emit(page);
        }
        pending_.clear();
        out_.close();
        if (out_.fail()) {
            throw TafError("closing " + path_.string() + " failed");
        }
        return written_;
    }

   private:
    static void renumber(OggPage &page, uint32_t sequence) {
        if (page.page_sequence_number != sequence) {
            page.page_sequence_number = sequence;
            page.update_checksum();
        }
    }

    void emit(const OggPage &page) {
        if (!write_page(out_, page)) {
            throw TafError("write failed for " + path_.string());
        }
        ++written_;
    }

    std::filesystem::path path_;
    std::ofstream out_;
    std::vector<OggPage> pending_;
    uint32_t next_sequence_ = 0;
    size_t written_ = 0;
};

}  // namespace

std::vector<ChapterRange> chapter_ranges(const std::vector<uint32_t> &chapter_pages,
                                         size_t total_pages) {
    std::vector<ChapterRange> ranges;
    if (chapter_pages.empty()) {
        ranges.push_back(ChapterRange{0, total_pages});
        return ranges;
    }
    std::vector<size_t> starts;
    starts.reserve(chapter_pages.size());
    for (size_t i = 0; i < chapter_pages.size(); ++i) {
        size_t start = chapter_pages[i];
        if (start > total_pages) {
            TF_LOG("warn", "chapter " << (i + 1) << " starts at page " << start
                                      << " beyond the " << total_pages
                                      << " available pages; clamping");
            start = total_pages;
        }
        if (!starts.empty() && start < starts.back()) {
            TF_LOG("warn", "chapter " << (i + 1) << " starts at page " << start
                                      << " before its predecessor at " << starts.back());
            start = starts.back();
        }
        starts.push_back(start);
    }
    for (size_t i = 0; i < starts.size(); ++i) {
        const size_t end = (i + 1 < starts.size()) ? starts[i + 1] : total_pages;
        ranges.push_back(ChapterRange{starts[i], end});
    }
    return ranges;
}

std::string chapter_file_name(size_t chapter_number, const std::string &source_path) {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << chapter_number << '_'
        << std::filesystem::path(source_path).stem().string() << ".opus";
    return oss.str();
}

std::vector<std::string> split(const std::string &path, const std::string &output_dir,
                               const SplitOptions &options) {
    const auto file = open_taf(path);
    if (!file) {
        throw TafError("file does not exist: " + path);
    }
    if (file->total_size < TafFile::header_region_size) {
        throw HeaderDecodeError(path + " is shorter than the header region", 0,
                                TafFile::header_region_size, file->total_size);
    }
    auto in = open_input(*file);
    const TonieHeader header = read_header(in, file->total_size).header;

    // Counting pass; the splitting pass below re-reads them.
    OggPageReader counter(in, TafFile::audio_region_offset);
    while (counter.next()) {
    }
    const size_t total_pages = counter.pages_read();
    if (total_pages == 0) {
        throw StreamFormatError("no ogg pages to split in " + path);
    }
    const AudioStreamInfo audio = analyze_audio_stream(in, TafFile::audio_region_offset);

    const auto ranges = chapter_ranges(header.chapter_pages, total_pages);
    TF_LOG("info", "splitting " << path << ": " << total_pages << " pages ("
                                << static_cast<int>(audio.channel_count) << " ch, serial "
                                << audio.stream_serial << ") into " << ranges.size()
                                << " chapter(s)");

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw TafError("cannot create output directory " + output_dir + ": " + ec.message());
    }

    OggPageReader reader(in, TafFile::audio_region_offset);
    std::vector<OggPage> header_pages;
    for (size_t i = 0; i < kStreamHeaderPages; ++i) {
        auto page = reader.next();
        if (!page) {
            throw StreamFormatError("stream header page " + std::to_string(i) + " missing");
        }
        header_pages.push_back(std::move(*page));
    }
    size_t index = kStreamHeaderPages;
    std::optional<OggPage> lookahead = reader.next();

    OutputGuard guard;
    std::vector<std::filesystem::path> finals;
    std::vector<std::filesystem::path> partials;
    for (size_t c = 0; c < ranges.size(); ++c) {
        const auto final_path =
            std::filesystem::path(output_dir) / chapter_file_name(c + 1, path);
        auto partial_path = final_path;
        partial_path += kPartialSuffix;
        guard.track(partial_path);

        // Pages 0 and 1 are the stream headers every output already starts with.
        const size_t first = std::max(ranges[c].first_page, kStreamHeaderPages);
        const size_t end = std::max(ranges[c].end_page, first);
        if (ranges[c].size() == 0) {
            TF_LOG("warn", "chapter " << (c + 1) << " has no pages");
        }

        ChapterWriter writer(partial_path, header_pages);
        while (lookahead && index < end) {
            if (index >= first) {
                writer.add(std::move(*lookahead));
            } else {
                TF_LOG("split", "page " << index << " precedes chapter " << (c + 1)
                                        << "; skipped");
            }
            lookahead = reader.next();
            ++index;
        }
        const size_t written = writer.finish(options.mark_end_of_stream);
        TF_LOG("split", "chapter " << (c + 1) << ": pages [" << first << ", " << end << ") -> "
                                   << final_path.string() << " (" << written << " pages)");
        finals.push_back(final_path);
        partials.push_back(partial_path);
    }

    for (size_t i = 0; i < finals.size(); ++i) {
        std::filesystem::rename(partials[i], finals[i], ec);
        if (ec) {
            throw TafError("cannot rename " + partials[i].string() + ": " + ec.message());
        }
        // Only files this call produced are removed if a later rename fails.
        guard.track(finals[i]);
    }
    guard.release();

    std::vector<std::string> written;
    written.reserve(finals.size());
    for (const auto &p : finals) {
        written.push_back(p.string());
    }
    return written;
}

}  // namespace tafforge
