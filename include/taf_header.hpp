//
//  taf_header.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "sha1_accumulator.hpp"

inline constexpr size_t kTafHeaderBlockSize = 4096;
inline constexpr size_t kTafLengthPrefixSize = 4;
inline constexpr size_t kTafMaxHeaderMessage = kTafHeaderBlockSize - kTafLengthPrefixSize;

struct TafHeader {
    uint32_t audio_id = 0;  // creation time; doubles as the Ogg serial number
    Sha1Digest sha1_hash{};
    uint32_t num_bytes = 0;  // length of the audio region after the 4096-byte block
    std::vector<uint32_t> track_page_nums;
    size_t fill_bytes = 0;  // length of the padding field; informational on parse
};

// Serialize the TonieHeader message (proto/tonie_header.proto) with a padding field sized
// so that 4 + L reaches the block size. Throws TafError(HeaderOverflow) when the message
// without padding exceeds 4092 bytes.
std::vector<uint8_t> serialize_taf_header(const TafHeader &header);

// Full 4096-byte block: big-endian length prefix, message, zero padding.
std::vector<uint8_t> build_taf_header_block(const TafHeader &header);

// Parse a header message. Fields may appear in any order; the chapter list may be packed
// or unpacked; unknown fields are skipped. Throws TafError(MalformedHeader) when protobuf
// rejects the message or the hash is not 20 bytes.
TafHeader parse_taf_header(const uint8_t *data, size_t size);
