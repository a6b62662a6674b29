// File comparison: identity, size and content differences, missing files, page-level diffs.
#include <cstdint>
#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include "taf_comparator.hpp"
#include "taf_test_utils.hpp"

using namespace taf_test_utils;
using tafforge::ComparisonResult;
using tafforge::PageSide;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[taf_comparator_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool has_error(const ComparisonResult &r, const std::string &needle) {
    for (const auto &e : r.errors) {
        if (e.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool test_identical_files() {
    bool ok = true;
    const auto bytes = make_taf_of_size(TafFixture{}, 10000);
    ok &= check(bytes.size() == 10000, "10000-byte fixture");
    const auto a = write_temp_file(bytes, "tafforge_cmp_same_a.taf");
    const auto b = write_temp_file(bytes, "tafforge_cmp_same_b.taf");

    const auto r = tafforge::compare(a.string(), b.string());
    ok &= check(r.identical, "identical content");
    ok &= check(r.file_size_diff == 0, "no size difference");
    ok &= check(r.errors.empty() && r.metadata_diff.empty() && r.audio_diff.empty(),
                "no diffs for identical files");
    ok &= check(!r.ogg_pages_diff.has_value(), "no page diff unless detailed");

    const auto self = tafforge::compare(a.string(), a.string(), true);
    ok &= check(self.identical, "a file is identical to itself");
    ok &= check(!self.ogg_pages_diff.has_value(), "byte-identical files skip the page walk");

    std::filesystem::remove(a);
    std::filesystem::remove(b);
    return ok;
}

bool test_audio_payload_difference() {
    bool ok = true;
    const auto small = make_taf_of_size(TafFixture{}, 10000);
    const auto large = make_taf_of_size(TafFixture{}, 12000);
    ok &= check(small.size() == 10000 && large.size() == 12000, "fixture sizes");
    const auto a = write_temp_file(small, "tafforge_cmp_10k.taf");
    const auto b = write_temp_file(large, "tafforge_cmp_12k.taf");

    const auto r = tafforge::compare(a.string(), b.string());
    ok &= check(!r.identical, "different payloads are not identical");
    ok &= check(r.file_size_diff == 2000, "size difference is B - A");
    ok &= check(r.errors.empty(), "both files decode");
    ok &= check(r.audio_diff.count("audio_size") == 1, "audio size differs");
    ok &= check(r.audio_diff.count("audio_sha1") == 1, "audio hash differs");
    ok &= check(r.audio_diff.count("channel_count") == 0, "channels agree");
    ok &= check(r.metadata_diff.count("data_length") == 1, "declared length differs");
    ok &= check(r.metadata_diff.count("timestamp") == 0, "timestamps agree");

    const auto reverse = tafforge::compare(b.string(), a.string());
    ok &= check(reverse.file_size_diff == -2000, "size difference is antisymmetric");
    const auto &fwd = r.metadata_diff.at("data_length");
    const auto &bwd = reverse.metadata_diff.at("data_length");
    ok &= check(fwd.value_a == bwd.value_b && fwd.value_b == bwd.value_a,
                "field values swap with argument order");

    std::filesystem::remove(a);
    std::filesystem::remove(b);
    return ok;
}

bool test_missing_file() {
    bool ok = true;
    const auto a = write_temp_file(make_taf(TafFixture{}), "tafforge_cmp_present.taf");
    const auto missing = std::filesystem::temp_directory_path() / "tafforge_cmp_missing.taf";
    std::filesystem::remove(missing);

    const auto r = tafforge::compare(a.string(), missing.string(), true);
    ok &= check(!r.identical, "missing file is never identical");
    ok &= check(has_error(r, "One or both files do not exist"), "descriptive error");
    ok &= check(has_error(r, missing.string()), "missing path named");
    ok &= check(r.file_size_diff < 0, "missing file counts as size zero");

    const auto both = tafforge::compare(missing.string(), missing.string());
    ok &= check(!both.identical, "two missing files are not identical");

    std::filesystem::remove(a);
    return ok;
}

bool test_metadata_and_comments() {
    bool ok = true;
    TafFixture fa;
    TafFixture fb;
    fb.serial = 0x0BADF00D;
    fb.chapter_pages = {0, 5};
    fb.comments = {"title=Other", "ARTIST=Tests", "ALBUM=New"};
    const auto a = write_temp_file(make_taf(fa), "tafforge_cmp_meta_a.taf");
    const auto b = write_temp_file(make_taf(fb), "tafforge_cmp_meta_b.taf");

    const auto r = tafforge::compare(a.string(), b.string());
    ok &= check(!r.identical, "metadata differences break identity");
    ok &= check(r.metadata_diff.count("timestamp") == 1, "timestamp differs");
    ok &= check(r.metadata_diff.count("chapter_pages") == 1, "chapter list differs");
    ok &= check(r.metadata_diff.count("chapter_count") == 1, "chapter count differs");
    ok &= check(r.metadata_diff.count("comment:TITLE") == 1, "title comment differs");
    ok &= check(r.metadata_diff.count("comment:ARTIST") == 0, "artist comment agrees");
    const auto album = r.metadata_diff.find("comment:ALBUM");
    ok &= check(album != r.metadata_diff.end() && !album->second.value_a &&
                    album->second.value_b == std::string("New"),
                "comment only present in B");
    ok &= check(r.audio_diff.count("stream_serial") == 1, "serial differs");

    std::filesystem::remove(a);
    std::filesystem::remove(b);
    return ok;
}

bool test_padding_only_difference() {
    bool ok = true;
    TafFixture fx;
    const auto padded = make_taf(fx);

    // Same fields, raw zero fill instead of a padding field.
    const auto audio = make_audio_stream(fx);
    HeaderFields h;
    const auto digest = tafforge::sha1_of(audio);
    h.hash.assign(digest.begin(), digest.end());
    h.data_length = audio.size();
    h.timestamp = fx.serial;
    h.chapter_pages = fx.chapter_pages;
    std::vector<uint8_t> zero_filled;
    put_u32_be(zero_filled, 4092);
    const auto msg = encode_header_fields(h);
    zero_filled.insert(zero_filled.end(), msg.begin(), msg.end());
    zero_filled.resize(4096, 0);
    zero_filled.insert(zero_filled.end(), audio.begin(), audio.end());

    ok &= check(padded.size() == zero_filled.size() && padded != zero_filled,
                "same size, different header bytes");
    const auto a = write_temp_file(padded, "tafforge_cmp_pad_a.taf");
    const auto b = write_temp_file(zero_filled, "tafforge_cmp_pad_b.taf");
    const auto r = tafforge::compare(a.string(), b.string());
    ok &= check(r.identical, "padding-only differences keep files identical");
    ok &= check(r.metadata_diff.empty() && r.audio_diff.empty(), "no field differences");

    std::filesystem::remove(a);
    std::filesystem::remove(b);
    return ok;
}

bool test_detailed_page_diff() {
    bool ok = true;
    TafFixture fa;
    TafFixture fb;
    fb.total_pages = 12;
    auto bytes_b = make_taf(fb);
    bytes_b[bytes_b.size() - 10] ^= 0x01;  // corrupt the payload of B's last page
    const auto a = write_temp_file(make_taf(fa), "tafforge_cmp_pages_a.taf");
    const auto b = write_temp_file(bytes_b, "tafforge_cmp_pages_b.taf");

    const auto r = tafforge::compare(a.string(), b.string(), true);
    ok &= check(!r.identical, "different page counts");
    ok &= check(r.ogg_pages_diff.has_value(), "detailed diff present");
    if (!r.ogg_pages_diff) {
        return false;
    }
    const auto &pages = *r.ogg_pages_diff;
    ok &= check(pages.total_pages_a == 10 && pages.total_pages_b == 12, "page totals");
    ok &= check(pages.page_differences.size() == 3, "page 9 differs, pages 10-11 only in B");
    if (pages.page_differences.size() == 3) {
        const auto &p9 = pages.page_differences[0];
        ok &= check(p9.page_index == 9 && p9.side == PageSide::Both, "page 9 in both");
        ok &= check(p9.differing_fields.count("header_type") == 1, "EOS flag differs");
        ok &= check(p9.differing_fields.count("granule_position") == 0, "granule agrees");
        ok &= check(pages.page_differences[1].page_index == 10 &&
                        pages.page_differences[1].side == PageSide::OnlyB,
                    "page 10 only in B");
        ok &= check(pages.page_differences[2].side == PageSide::OnlyB, "page 11 only in B");
    }
    ok &= check(pages.checksum_failures_a.empty(), "A verifies");
    ok &= check(pages.checksum_failures_b == std::vector<size_t>({11}), "B's last page fails");
    ok &= check(r.audio_diff.count("page_count") == 1, "page count in audio diff");

    tafforge::CompareOptions no_crc;
    no_crc.detailed = true;
    no_crc.verify_checksums = false;
    const auto quiet = tafforge::compare(a.string(), b.string(), no_crc);
    ok &= check(quiet.ogg_pages_diff && quiet.ogg_pages_diff->checksum_failures_b.empty(),
                "checksum verification can be disabled");

    std::filesystem::remove(a);
    std::filesystem::remove(b);
    return ok;
}

bool test_malformed_and_empty() {
    bool ok = true;
    const auto good = write_temp_file(make_taf(TafFixture{}), "tafforge_cmp_good.taf");
    const auto bad = write_temp_file(std::vector<uint8_t>(50, 0xFF), "tafforge_cmp_bad.taf");
    const auto r = tafforge::compare(good.string(), bad.string(), true);
    ok &= check(!r.identical, "malformed file is not identical");
    ok &= check(has_error(r, "file B"), "decode failure attributed to B");
    ok &= check(r.metadata_diff.empty(), "no field diff without both headers");

    const auto e1 = write_temp_file({}, "tafforge_cmp_empty_a.taf");
    const auto e2 = write_temp_file({}, "tafforge_cmp_empty_b.taf");
    const auto empty = tafforge::compare(e1.string(), e2.string());
    ok &= check(empty.identical && empty.file_size_diff == 0, "two empty files are identical");

    for (const auto &p : {good, bad, e1, e2}) {
        std::filesystem::remove(p);
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_identical_files();
    ok &= test_audio_payload_difference();
    ok &= test_missing_file();
    ok &= test_metadata_and_comments();
    ok &= test_padding_only_difference();
    ok &= test_detailed_page_diff();
    ok &= test_malformed_and_empty();
    return ok ? 0 : 1;
}
