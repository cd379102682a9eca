//
//  ogg_page.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include <ogg/ogg.h>

inline constexpr size_t kOggPageHeaderSize = 27;
inline constexpr size_t kOggMaxLacingValues = 255;

inline constexpr uint8_t kOggFlagContinued = 0x01;
inline constexpr uint8_t kOggFlagBos = 0x02;
inline constexpr uint8_t kOggFlagEos = 0x04;

// One on-disk Ogg page. Packets are stored de-laced; serialize() rebuilds the segment
// table. When `continued` is set the first packet is the tail of one started on the
// previous page; when `last_packet_complete` is false the last packet carries on into the
// next page (its size is then a multiple of 255).
struct OggPage {
    uint8_t version = 0;
    uint8_t header_type = 0;
    uint64_t granule_position = 0;
    uint32_t serial_no = 0;
    uint32_t page_no = 0;
    uint32_t checksum = 0;  // as read from disk; recomputed by serialize()
    std::vector<std::vector<uint8_t>> packets;
    bool last_packet_complete = true;

    bool continued() const { return (header_type & kOggFlagContinued) != 0; }
    bool bos() const { return (header_type & kOggFlagBos) != 0; }
    bool eos() const { return (header_type & kOggFlagEos) != 0; }

    // Number of lacing values this page needs.
    size_t lacing_count() const;

    // Payload bytes (sum of packet sizes).
    size_t body_size() const;

    // Total serialized size: header + lacing table + payload.
    size_t size() const { return kOggPageHeaderSize + lacing_count() + body_size(); }

    // Serialize; the CRC is computed by ogg_page_checksum_set.
    std::vector<uint8_t> serialize() const;
};

// Lacing values needed for a packet of `size` bytes that terminates on this page.
inline size_t lacing_values_for(size_t size) { return size / 255 + 1; }

// Copy a page found by libogg into the de-laced model.
OggPage ogg_page_from(const ogg_page &og);

// Page scanner over an in-memory byte range on top of ogg_sync_state. Input is fed in
// 4096-byte chunks; ogg_sync_pageseek finds each page, verifies its CRC and skips whatever
// lies between pages (garbage, damaged pages). The ogg_page returned by next_page() points
// into the sync buffer and is only valid until the following call.
class OggSyncScanner {
   public:
    OggSyncScanner(const uint8_t *data, size_t size);
    ~OggSyncScanner();

    OggSyncScanner(const OggSyncScanner &) = delete;
    OggSyncScanner &operator=(const OggSyncScanner &) = delete;

    // Next verified page; false once the input is exhausted. `skipped` receives the number
    // of bytes libogg discarded before this page (or before the end).
    bool next_page(ogg_page &page, size_t &skipped);

    // Bytes consumed so far: every returned page and every skipped byte.
    size_t consumed() const { return consumed_; }

    // Bytes left over after next_page() returned false (an incomplete trailing page).
    size_t pending() const { return size_ - consumed_; }

   private:
    ogg_sync_state sync_;
    const uint8_t *data_;
    size_t size_;
    size_t fed_ = 0;
    size_t consumed_ = 0;
};
