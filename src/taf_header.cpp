//
//  taf_header.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "taf_header.hpp"

#include <google/protobuf/io/coded_stream.h>

#include <string>

#include "byte_io.hpp"
#include "logging.hpp"
#include "taf_error.hpp"
#include "tonie_header.pb.h"

namespace {

[[noreturn]] void malformed(const std::string &what) {
    throw TafError(TafErrorKind::MalformedHeader, "header message: " + what);
}

// Largest padding length whose field (tag, length varint, zeros) fits `avail` bytes. When
// the varint width steps down the message may end up one byte short of the block.
size_t padding_for(size_t avail) {
    size_t fill = avail - 2;
    while (1 + google::protobuf::io::CodedOutputStream::VarintSize32(
                   static_cast<uint32_t>(fill)) +
               fill >
           avail) {
        --fill;
    }
    return fill;
}

}  // namespace

std::vector<uint8_t> serialize_taf_header(const TafHeader &header) {
    tafforge::TonieHeader msg;
    msg.set_datahash(std::string(header.sha1_hash.begin(), header.sha1_hash.end()));
    msg.set_datalength(header.num_bytes);
    msg.set_timestamp(header.audio_id);
    for (uint32_t page : header.track_page_nums) {
        msg.add_chapterpages(page);
    }

    const size_t base = msg.ByteSizeLong();
    if (base > kTafMaxHeaderMessage) {
        throw TafError(TafErrorKind::HeaderOverflow,
                       "header message needs " + std::to_string(base) + " bytes for " +
                           std::to_string(header.track_page_nums.size()) +
                           " chapters; the block holds " +
                           std::to_string(kTafMaxHeaderMessage));
    }
    const size_t avail = kTafMaxHeaderMessage - base;
    if (avail >= 2) {
        const size_t fill = padding_for(avail);
        msg.set_padding(std::string(fill, '\0'));
        TF_LOG("debug", "header: message " << msg.ByteSizeLong() << " bytes (fill " << fill
                                           << ")");
    }

    std::string out;
    if (!msg.SerializeToString(&out)) {
        throw TafError(TafErrorKind::EncodeError, "header message serialization failed");
    }
    return std::vector<uint8_t>(out.begin(), out.end());
}

std::vector<uint8_t> build_taf_header_block(const TafHeader &header) {
    const auto msg = serialize_taf_header(header);
    std::vector<uint8_t> block;
    block.reserve(kTafHeaderBlockSize);
    write_u32_be(block, static_cast<uint32_t>(msg.size()));
    block.insert(block.end(), msg.begin(), msg.end());
    block.resize(kTafHeaderBlockSize, 0);
    return block;
}

TafHeader parse_taf_header(const uint8_t *data, size_t size) {
    tafforge::TonieHeader msg;
    if (!msg.ParseFromArray(data, static_cast<int>(size))) {
        malformed("not a valid TonieHeader (" + std::to_string(size) + " bytes)");
    }
    if (msg.datahash().size() != kSha1DigestSize) {
        malformed("dataHash is " + std::to_string(msg.datahash().size()) +
                  " bytes, expected 20");
    }

    TafHeader header;
    for (size_t i = 0; i < kSha1DigestSize; ++i) {
        header.sha1_hash[i] = static_cast<uint8_t>(msg.datahash()[i]);
    }
    header.num_bytes = msg.datalength();
    header.audio_id = msg.timestamp();
    header.track_page_nums.assign(msg.chapterpages().begin(), msg.chapterpages().end());
    header.fill_bytes = msg.padding().size();
    return header;
}
