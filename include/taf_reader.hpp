//
//  taf_reader.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ogg_page.hpp"
#include "sha1_accumulator.hpp"
#include "taf_header.hpp"

// Forward-only scan over the audio region on top of OggSyncScanner. Pages whose CRC does
// not verify are skipped by libogg; each skipped run counts as one damaged region and is
// logged. Throws TafError(MalformedHeader) when the region holds no page at all, when it
// ends inside a page that follows an intact one, or for a page version other than 0.
// Sequence gaps are logged.
class OggPageCursor {
   public:
    OggPageCursor(const uint8_t *data, size_t size, size_t base_offset)
        : scanner_(data, size), base_offset_(base_offset) {}

    std::optional<OggPage> next();

    // Absolute file offset just past the last page returned.
    size_t offset() const { return base_offset_ + scanner_.consumed(); }
    uint32_t pages_read() const { return pages_read_; }
    uint32_t damaged_regions() const { return damaged_regions_; }

   private:
    OggSyncScanner scanner_;
    size_t base_offset_;
    uint32_t pages_read_ = 0;
    uint32_t damaged_regions_ = 0;
    bool finished_ = false;
    std::optional<uint32_t> expected_seq_;
};

// A validated TAF file held in memory. Cursors returned by pages() borrow the handle's
// bytes and must not outlive it.
class TafHandle {
   public:
    const TafHeader &header() const { return header_; }
    uint64_t audio_length() const { return bytes_.size() - kTafHeaderBlockSize; }
    const std::vector<uint32_t> &chapter_pages() const { return header_.track_page_nums; }
    const Sha1Digest &computed_hash() const { return computed_hash_; }
    bool hash_verified() const { return hash_ok_; }
    uint32_t header_length() const { return header_length_; }
    // Non-zero bytes found between the header message and the end of the 4096-byte block.
    size_t header_tail_nonzero() const { return header_tail_nonzero_; }

    OggPageCursor pages() const {
        return OggPageCursor(bytes_.data() + kTafHeaderBlockSize, audio_length(),
                             kTafHeaderBlockSize);
    }

   private:
    friend class TafReader;
    std::vector<uint8_t> bytes_;
    TafHeader header_;
    Sha1Digest computed_hash_{};
    bool hash_ok_ = false;
    uint32_t header_length_ = 0;
    size_t header_tail_nonzero_ = 0;
};

class TafReader {
   public:
    // Validate layout and hash. Throws TafError: MalformedHeader for layout violations,
    // HashMismatch when the audio region does not match the embedded SHA-1 (unless
    // verify_hash is false, in which case hash_verified() reports the outcome). Non-zero
    // bytes between the header message and the end of the block are logged.
    static TafHandle open(std::vector<uint8_t> bytes, bool verify_hash = true);

    // Same as open() after reading the whole file; IoError when it cannot be read.
    static TafHandle open_file(const std::string &path, bool verify_hash = true);
};

// Read a whole file; throws TafError(IoError).
std::vector<uint8_t> read_file_bytes(const std::string &path);
