// TafReader: validation order, hash enforcement and behaviour on damaged files.
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "byte_io.hpp"
#include "sha1_accumulator.hpp"
#include "taf_error.hpp"
#include "taf_header.hpp"
#include "taf_reader.hpp"
#include "taf_writer.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[taf_reader_safety] FAIL: " << msg << "\n";
    }
    return cond;
}

std::vector<uint8_t> make_taf(size_t packets, size_t size, std::set<size_t> boundaries) {
    std::vector<AudioPacket> list;
    for (size_t i = 0; i < packets; ++i) {
        AudioPacket p;
        p.data = test_utils::tagged_payload(i, size, 0xF8);
        p.duration = 960;
        list.push_back(p);
    }
    PageMuxerConfig cfg;
    cfg.max_page_size = 512;
    cfg.stream_headers = {test_utils::opus_head(), test_utils::opus_tags()};
    std::ostringstream out;
    TafWriter writer(out);
    writer.write(std::move(list), std::move(boundaries), cfg, 0x5EED);
    const std::string s = out.str();
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Header block describing `region` with a correct hash and the given chapter table.
std::vector<uint8_t> assemble(const std::vector<uint8_t> &region,
                              const std::vector<uint32_t> &chapters) {
    TafHeader h;
    h.audio_id = 1;
    h.sha1_hash = sha1_digest(region.data(), region.size());
    h.num_bytes = static_cast<uint32_t>(region.size());
    h.track_page_nums = chapters;
    auto file = build_taf_header_block(h);
    file.insert(file.end(), region.begin(), region.end());
    return file;
}

std::vector<uint8_t> region_of(const std::vector<uint8_t> &file) {
    return std::vector<uint8_t>(file.begin() + kTafHeaderBlockSize, file.end());
}

TafErrorKind open_kind(std::vector<uint8_t> file, bool verify = true) {
    try {
        TafReader::open(std::move(file), verify);
    } catch (const TafError &e) {
        return e.kind();
    }
    return TafErrorKind::None;
}

bool test_valid_open() {
    const auto file = make_taf(30, 50, {10, 20});
    const auto handle = TafReader::open(file);
    bool ok = check(handle.hash_verified(), "hash verified");
    ok &= check(handle.audio_length() == file.size() - kTafHeaderBlockSize, "audio length");
    ok &= check(handle.chapter_pages().size() == 3 && handle.chapter_pages()[0] == 0,
                "three chapters");
    ok &= check(handle.header().audio_id == 0x5EED, "audio id");
    ok &= check(handle.header_length() + kTafLengthPrefixSize >= 4095, "header length");
    ok &= check(handle.computed_hash() == handle.header().sha1_hash, "computed hash exposed");

    auto cursor = handle.pages();
    uint32_t n = 0;
    while (auto page = cursor.next()) {
        ok &= check(page->page_no == n, "cursor yields pages in order");
        ++n;
    }
    ok &= check(n == test_utils::walk_pages(file, kTafHeaderBlockSize).size(),
                "cursor sees every page");
    ok &= check(cursor.offset() == file.size() && cursor.damaged_regions() == 0,
                "cursor ends at end of file without damaged regions");
    ok &= check(handle.header_tail_nonzero() == 0, "header block tail is zero");
    return ok;
}

bool test_every_byte_flip_detected() {
    const auto file = make_taf(20, 40, {8});
    bool ok = true;
    size_t missed = 0;
    for (size_t i = kTafHeaderBlockSize; i < file.size(); ++i) {
        auto damaged = file;
        damaged[i] ^= 0x01;
        if (open_kind(damaged) != TafErrorKind::HashMismatch) {
            ++missed;
        }
    }
    ok &= check(missed == 0, "every single-bit flip in the audio region is a HashMismatch (" +
                                 std::to_string(missed) + " missed)");

    auto damaged = file;
    damaged.back() ^= 0x80;
    const auto handle = TafReader::open(damaged, false);
    ok &= check(!handle.hash_verified(), "unverified open reports the mismatch");
    ok &= check(handle.computed_hash() != handle.header().sha1_hash, "hashes differ");
    return ok;
}

bool test_malformed_layout() {
    const auto file = make_taf(20, 40, {8});
    bool ok = check(open_kind(std::vector<uint8_t>(file.begin(), file.begin() + 4095)) ==
                        TafErrorKind::MalformedHeader,
                    "file shorter than the header block");
    ok &= check(open_kind(std::vector<uint8_t>(4096, 0)) == TafErrorKind::MalformedHeader,
                "zero-length header message has no hash");

    auto long_prefix = file;
    long_prefix[0] = 0x00;
    long_prefix[1] = 0x00;
    long_prefix[2] = 0x0F;
    long_prefix[3] = 0xFD;  // 4093
    ok &= check(open_kind(long_prefix) == TafErrorKind::MalformedHeader,
                "header length beyond 4092");

    auto extra = file;
    extra.push_back(0);
    ok &= check(open_kind(extra) == TafErrorKind::MalformedHeader,
                "trailing byte contradicts dataLength");

    auto shorter = file;
    shorter.pop_back();
    ok &= check(open_kind(shorter) == TafErrorKind::MalformedHeader,
                "missing byte contradicts dataLength");

    auto garbled = file;
    garbled[4] = 0x0B;  // wire type 3 where the hash tag should be
    ok &= check(open_kind(garbled) == TafErrorKind::MalformedHeader, "garbled header message");
    return ok;
}

bool test_bad_chapter_tables() {
    const auto region = region_of(make_taf(20, 40, {}));
    bool ok = check(open_kind(assemble(region, {0, 2})) == TafErrorKind::None,
                    "well-formed table accepted");
    ok &= check(open_kind(assemble(region, {})) == TafErrorKind::MalformedHeader,
                "empty chapter table");
    ok &= check(open_kind(assemble(region, {1, 2})) == TafErrorKind::MalformedHeader,
                "table not starting at page 0");
    ok &= check(open_kind(assemble(region, {0, 3, 3})) == TafErrorKind::MalformedHeader,
                "duplicate entries");
    ok &= check(open_kind(assemble(region, {0, 5, 2})) == TafErrorKind::MalformedHeader,
                "descending entries");
    return ok;
}

bool test_cursor_on_damaged_pages() {
    // Valid hash over bytes that are not Ogg pages: open succeeds, the scan does not.
    std::vector<uint8_t> garbage(100, 0x5A);
    const auto handle = TafReader::open(assemble(garbage, {0}));
    auto cursor = handle.pages();
    bool threw = false;
    try {
        cursor.next();
    } catch (const TafError &e) {
        threw = e.kind() == TafErrorKind::MalformedHeader;
    }
    bool ok = check(threw, "non-page audio region is MalformedHeader on scan");

    // Flip a byte inside the OpusHead payload and re-hash: the page fails its CRC and is
    // skipped as one damaged region, not an error.
    const auto intact = region_of(make_taf(20, 40, {8}));
    auto region = intact;
    region[30] ^= 0xFF;
    const auto crc_handle = TafReader::open(assemble(region, {0}));
    auto crc_cursor = crc_handle.pages();
    uint32_t pages = 0;
    std::optional<uint32_t> first_seq;
    while (auto page = crc_cursor.next()) {
        if (!first_seq) {
            first_seq = page->page_no;
        }
        ++pages;
    }
    ok &= check(crc_cursor.damaged_regions() == 1, "damaged page counted once");
    ok &= check(first_seq && *first_seq == 1, "scan resumes at the page after the damage");
    ok &= check(pages == crc_cursor.pages_read() &&
                    pages + 1 == test_utils::walk_pages(intact).size(),
                "every other page is still returned");

    // A page with version 1 and a valid CRC.
    OggPage future;
    future.version = 1;
    future.header_type = kOggFlagBos | kOggFlagEos;
    const auto future_handle = TafReader::open(assemble(future.serialize(), {0}));
    auto future_cursor = future_handle.pages();
    threw = false;
    try {
        future_cursor.next();
    } catch (const TafError &e) {
        threw = e.kind() == TafErrorKind::MalformedHeader;
    }
    ok &= check(threw, "page version other than 0 is MalformedHeader");

    // Damage inside the final page: counted like any other damaged region.
    auto tail = intact;
    tail[tail.size() - 3] ^= 0x10;
    const auto tail_handle = TafReader::open(assemble(tail, {0}));
    auto tail_cursor = tail_handle.pages();
    uint32_t tail_pages = 0;
    threw = false;
    try {
        while (tail_cursor.next()) {
            ++tail_pages;
        }
    } catch (const TafError &) {
        threw = true;
    }
    ok &= check(!threw && tail_cursor.damaged_regions() == 1 && tail_pages == pages,
                "damaged last page is skipped, not an error");
    ok &= check(!tail_cursor.next(), "cursor stays finished");

    // Truncated last page.
    auto cut = region_of(make_taf(20, 40, {}));
    cut.resize(cut.size() - 5);
    const auto cut_handle = TafReader::open(assemble(cut, {0}));
    auto cut_cursor = cut_handle.pages();
    threw = false;
    try {
        while (cut_cursor.next()) {
        }
    } catch (const TafError &e) {
        threw = e.kind() == TafErrorKind::MalformedHeader;
    }
    ok &= check(threw, "truncated trailing page is MalformedHeader");
    return ok;
}

// Header message without a padding field, so the block has a zero tail after it.
std::vector<uint8_t> short_header_file(const std::vector<uint8_t> &region) {
    const Sha1Digest hash = sha1_digest(region.data(), region.size());
    std::vector<uint8_t> msg = {0x0A, 0x14};
    msg.insert(msg.end(), hash.begin(), hash.end());
    msg.push_back(0x10);
    uint32_t len = static_cast<uint32_t>(region.size());
    while (len >= 0x80) {
        msg.push_back(static_cast<uint8_t>((len & 0x7F) | 0x80));
        len >>= 7;
    }
    msg.push_back(static_cast<uint8_t>(len));
    msg.insert(msg.end(), {0x22, 0x01, 0x00});

    std::vector<uint8_t> file;
    write_u32_be(file, static_cast<uint32_t>(msg.size()));
    file.insert(file.end(), msg.begin(), msg.end());
    file.resize(kTafHeaderBlockSize, 0);
    file.insert(file.end(), region.begin(), region.end());
    return file;
}

bool test_header_tail() {
    const auto region = region_of(make_taf(10, 30, {}));
    auto file = short_header_file(region);
    const auto clean = TafReader::open(file);
    bool ok = check(clean.header_length() < 40, "short header message accepted");
    ok &= check(clean.header_tail_nonzero() == 0, "zero tail reports nothing");

    file[kTafHeaderBlockSize - 1] = 0x7F;
    file[kTafHeaderBlockSize - 100] = 0x01;
    const auto dirty = TafReader::open(file);
    ok &= check(dirty.header_tail_nonzero() == 2, "non-zero tail bytes are counted");
    ok &= check(dirty.hash_verified() && dirty.chapter_pages().size() == 1,
                "a dirty tail does not fail the open");
    return ok;
}

bool test_files() {
    const fs::path dir = fs::temp_directory_path() / "tafforge_reader_safety";
    fs::create_directories(dir);
    const fs::path path = dir / "good.taf";
    const auto file = make_taf(10, 30, {});
    {
        std::ofstream f(path, std::ios::binary);
        f.write(reinterpret_cast<const char *>(file.data()),
                static_cast<std::streamsize>(file.size()));
    }
    bool ok = check(TafReader::open_file(path.string()).hash_verified(), "open_file");
    ok &= check(read_file_bytes(path.string()) == file, "read_file_bytes returns the file");

    bool threw = false;
    try {
        TafReader::open_file((dir / "missing.taf").string());
    } catch (const TafError &e) {
        threw = e.kind() == TafErrorKind::IoError;
    }
    ok &= check(threw, "missing file is an IoError");
    fs::remove_all(dir);
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_valid_open();
    ok &= test_every_byte_flip_detected();
    ok &= test_malformed_layout();
    ok &= test_bad_chapter_tables();
    ok &= test_cursor_on_damaged_pages();
    ok &= test_header_tail();
    ok &= test_files();
    return ok ? 0 : 1;
}
