//
//  ogg_demuxer.hpp
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

#include <ogg/ogg.h>

#include "ogg_page.hpp"

// Splits an in-memory Ogg stream back into packets with libogg. The first page's serial
// number selects the logical stream; pages of other streams are ignored. Garbage and pages
// with a bad CRC are skipped by ogg_sync_pageseek, and packets lost to such gaps are
// dropped by ogg_stream_packetout. Damage is reported as warnings, never thrown.
class OggPacketReader {
   public:
    OggPacketReader(std::vector<uint8_t> bytes, std::string label);
    ~OggPacketReader();

    OggPacketReader(const OggPacketReader &) = delete;
    OggPacketReader &operator=(const OggPacketReader &) = delete;

    std::optional<std::vector<uint8_t>> next_packet();

    uint32_t pages_read() const { return pages_read_; }
    uint64_t bytes_skipped() const { return bytes_skipped_; }

   private:
    bool load_page();

    std::vector<uint8_t> bytes_;
    std::string label_;
    OggSyncScanner scanner_;
    ogg_stream_state stream_;
    bool stream_ready_ = false;
    bool open_tail_ = false;  // last page ended inside a packet
    uint32_t pages_read_ = 0;
    uint64_t bytes_skipped_ = 0;
};
