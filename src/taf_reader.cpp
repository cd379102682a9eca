//
//  taf_reader.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "taf_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

#include "byte_io.hpp"
#include "logging.hpp"
#include "taf_error.hpp"

std::optional<OggPage> OggPageCursor::next() {
    if (finished_) {
        return std::nullopt;
    }
    ogg_page og;
    size_t skipped = 0;
    const bool found = scanner_.next_page(og, skipped);
    if (skipped > 0) {
        ++damaged_regions_;
        TF_LOG("warn", "skipped " << skipped << " damaged bytes (bad CRC or no page), scan at offset "
                                  << offset());
    }
    if (!found) {
        if (scanner_.pending() > 0 && skipped == 0) {
            throw TafError(TafErrorKind::MalformedHeader,
                           "truncated page at offset " + std::to_string(offset()) + " (" +
                               std::to_string(scanner_.pending()) + " bytes left)");
        }
        if (pages_read_ == 0 && skipped + scanner_.pending() > 0) {
            throw TafError(TafErrorKind::MalformedHeader,
                           "no Ogg page found in the audio region");
        }
        if (scanner_.pending() > 0) {
            TF_LOG("warn", "damaged region runs to the end (" << scanner_.pending()
                                                              << " trailing bytes)");
        }
        finished_ = true;
        return std::nullopt;
    }
    if (ogg_page_version(&og) != 0) {
        throw TafError(TafErrorKind::MalformedHeader,
                       "unsupported page version " + std::to_string(ogg_page_version(&og)) +
                           " before offset " + std::to_string(offset()));
    }

    OggPage page = ogg_page_from(og);
    if (expected_seq_ && page.page_no != *expected_seq_) {
        TF_LOG("warn", "page sequence gap: expected " << *expected_seq_ << ", found "
                                                      << page.page_no);
    }
    expected_seq_ = page.page_no + 1;
    ++pages_read_;
    return page;
}

std::vector<uint8_t> read_file_bytes(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw TafError(TafErrorKind::IoError, "open failed for " + path + " (" +
                                                  std::generic_category().message(errno) + ")");
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    if (len < 0) {
        throw TafError(TafErrorKind::IoError, "cannot determine size of " + path);
    }
    f.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(buf.data()), len);
    if (f.gcount() != len) {
        throw TafError(TafErrorKind::IoError, "short read for " + path);
    }
    return buf;
}

TafHandle TafReader::open(std::vector<uint8_t> bytes, bool verify_hash) {
    if (bytes.size() < kTafHeaderBlockSize) {
        throw TafError(TafErrorKind::MalformedHeader,
                       "file is " + std::to_string(bytes.size()) +
                           " bytes, shorter than the 4096-byte header block");
    }
    const uint32_t length = read_u32_be(bytes.data());
    if (length > kTafMaxHeaderMessage) {
        throw TafError(TafErrorKind::MalformedHeader,
                       "header length " + std::to_string(length) +
                           " overruns the 4096-byte header block");
    }

    const auto tail_begin = bytes.begin() + kTafLengthPrefixSize + length;
    const auto tail_end = bytes.begin() + kTafHeaderBlockSize;
    const size_t nonzero =
        static_cast<size_t>(std::count_if(tail_begin, tail_end, [](uint8_t b) { return b != 0; }));
    if (nonzero > 0) {
        TF_LOG("warn", nonzero << " non-zero bytes after the header message (block tail of "
                               << (kTafMaxHeaderMessage - length) << " bytes)");
    }

    TafHandle handle;
    handle.header_length_ = length;
    handle.header_tail_nonzero_ = nonzero;
    handle.header_ = parse_taf_header(bytes.data() + kTafLengthPrefixSize, length);
    const TafHeader &h = handle.header_;

    const uint64_t region = bytes.size() - kTafHeaderBlockSize;
    if (h.num_bytes != region) {
        throw TafError(TafErrorKind::MalformedHeader,
                       "header declares " + std::to_string(h.num_bytes) +
                           " audio bytes but the file holds " + std::to_string(region));
    }
    if (h.track_page_nums.empty()) {
        throw TafError(TafErrorKind::MalformedHeader, "chapter table is empty");
    }
    if (h.track_page_nums.front() != 0) {
        throw TafError(TafErrorKind::MalformedHeader,
                       "first chapter starts at page " + std::to_string(h.track_page_nums[0]));
    }
    for (size_t i = 1; i < h.track_page_nums.size(); ++i) {
        if (h.track_page_nums[i] <= h.track_page_nums[i - 1]) {
            throw TafError(TafErrorKind::MalformedHeader,
                           "chapter table not strictly ascending at entry " + std::to_string(i));
        }
    }

    handle.computed_hash_ =
        sha1_digest(bytes.data() + kTafHeaderBlockSize, static_cast<size_t>(region));
    handle.hash_ok_ = handle.computed_hash_ == h.sha1_hash;
    if (!handle.hash_ok_) {
        const std::string msg = "SHA-1 mismatch: header " + tafforge::hex_string(h.sha1_hash) +
                                ", audio region " + tafforge::hex_string(handle.computed_hash_);
        if (verify_hash) {
            throw TafError(TafErrorKind::HashMismatch, msg);
        }
        TF_LOG("warn", msg);
    }

    TF_LOG("debug", "opened TAF: audio_id=" << h.audio_id << " bytes=" << region
                                            << " chapters=" << h.track_page_nums.size()
                                            << " header_len=" << length);
    handle.bytes_ = std::move(bytes);
    return handle;
}

TafHandle TafReader::open_file(const std::string &path, bool verify_hash) {
    return open(read_file_bytes(path), verify_hash);
}
