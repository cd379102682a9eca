//
//  taf_writer.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <memory>
#include <ostream>
#include <set>
#include <vector>

#include "audio_packet.hpp"
#include "page_muxer.hpp"
#include "taf_header.hpp"

// How the header block, which depends on everything after it, gets to offset 0.
enum class WriteDiscipline {
    Spool,      // buffer all pages, then write header + pages; any sink
    SeekPatch,  // zero placeholder, stream pages, seek back and patch; seekable sink only
};

const char *write_discipline_name(WriteDiscipline discipline);

// Sink-side half of a write discipline. The writer calls begin() once, write_page() for
// every serialized page in order and finish() with the final 4096-byte header block.
// Failures throw TafError(IoError).
class HeaderWriteStrategy {
   public:
    virtual ~HeaderWriteStrategy() = default;

    virtual void begin() = 0;
    virtual void write_page(const std::vector<uint8_t> &bytes) = 0;
    virtual void finish(const std::vector<uint8_t> &header_block) = 0;
};

std::unique_ptr<HeaderWriteStrategy> make_write_strategy(WriteDiscipline discipline,
                                                         std::ostream &out);

struct TafWriteResult {
    TafHeader header;
    uint64_t bytes_written = 0;  // header block + audio region
    uint32_t page_count = 0;
    size_t packet_count = 0;
    uint64_t total_granule = 0;
};

class TafWriter {
   public:
    explicit TafWriter(std::ostream &out, WriteDiscipline discipline = WriteDiscipline::Spool)
        : out_(out), discipline_(discipline) {}

    // Mux, hash and emit a complete TAF stream. The muxer's serial number is forced to
    // audio_id. Throws TafError: EncodeError for muxer, packet source or header failures
    // (header overflow included), IoError for sink failures.
    TafWriteResult write(PacketSource &source, PageMuxerConfig config, uint32_t audio_id);

    TafWriteResult write(std::vector<AudioPacket> packets, std::set<size_t> boundaries,
                         PageMuxerConfig config, uint32_t audio_id);

   private:
    std::ostream &out_;
    WriteDiscipline discipline_;
};
