//
//  ogg_page.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ogg_page.hpp"

#include <algorithm>
#include <cstring>

#include "byte_io.hpp"
#include "logging.hpp"
#include "taf_error.hpp"

namespace {

constexpr size_t kCrcOffset = 22;
constexpr size_t kSyncChunkSize = 4096;
constexpr uint8_t kCapture[4] = {'O', 'g', 'g', 'S'};

}  // namespace

size_t OggPage::lacing_count() const {
    size_t n = 0;
    for (size_t i = 0; i < packets.size(); ++i) {
        const bool open_tail = (i + 1 == packets.size()) && !last_packet_complete;
        n += open_tail ? packets[i].size() / 255 : lacing_values_for(packets[i].size());
    }
    return n;
}

size_t OggPage::body_size() const {
    size_t n = 0;
    for (const auto &p : packets) {
        n += p.size();
    }
    return n;
}

std::vector<uint8_t> OggPage::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(size());
    out.insert(out.end(), kCapture, kCapture + 4);
    write_u8(out, version);
    write_u8(out, header_type);
    write_u64_le(out, granule_position);
    write_u32_le(out, serial_no);
    write_u32_le(out, page_no);
    write_u32_le(out, 0);  // CRC placeholder
    write_u8(out, static_cast<uint8_t>(lacing_count()));
    for (size_t i = 0; i < packets.size(); ++i) {
        const bool open_tail = (i + 1 == packets.size()) && !last_packet_complete;
        size_t remaining = packets[i].size();
        while (remaining >= 255) {
            write_u8(out, 255);
            remaining -= 255;
        }
        if (!open_tail) {
            write_u8(out, static_cast<uint8_t>(remaining));
        }
    }
    const size_t header_len = out.size();
    for (const auto &p : packets) {
        out.insert(out.end(), p.begin(), p.end());
    }

    ogg_page og;
    og.header = out.data();
    og.header_len = static_cast<long>(header_len);
    og.body = out.data() + header_len;
    og.body_len = static_cast<long>(out.size() - header_len);
    ogg_page_checksum_set(&og);
    return out;
}

OggPage ogg_page_from(const ogg_page &og) {
    OggPage p;
    p.version = static_cast<uint8_t>(ogg_page_version(&og));
    p.header_type = og.header[5];
    p.granule_position = static_cast<uint64_t>(ogg_page_granulepos(&og));
    p.serial_no = static_cast<uint32_t>(ogg_page_serialno(&og));
    p.page_no = static_cast<uint32_t>(ogg_page_pageno(&og));
    p.checksum = read_u32_le(og.header + kCrcOffset);

    const size_t segments = og.header[26];
    const uint8_t *lacing = og.header + kOggPageHeaderSize;
    const uint8_t *payload = og.body;
    std::vector<uint8_t> current;
    bool open = false;
    for (size_t i = 0; i < segments; ++i) {
        current.insert(current.end(), payload, payload + lacing[i]);
        payload += lacing[i];
        open = true;
        if (lacing[i] < 255) {
            p.packets.emplace_back(std::move(current));
            current.clear();
            open = false;
        }
    }
    if (open) {
        p.packets.emplace_back(std::move(current));
        p.last_packet_complete = false;
    }
    return p;
}

OggSyncScanner::OggSyncScanner(const uint8_t *data, size_t size) : data_(data), size_(size) {
    ogg_sync_init(&sync_);
}

OggSyncScanner::~OggSyncScanner() { ogg_sync_clear(&sync_); }

bool OggSyncScanner::next_page(ogg_page &page, size_t &skipped) {
    skipped = 0;
    while (true) {
        const long n = ogg_sync_pageseek(&sync_, &page);
        if (n > 0) {
            consumed_ += static_cast<size_t>(n);
            return true;
        }
        if (n < 0) {
            skipped += static_cast<size_t>(-n);
            consumed_ += static_cast<size_t>(-n);
            continue;
        }
        if (fed_ >= size_) {
            return false;
        }
        const size_t chunk = std::min(kSyncChunkSize, size_ - fed_);
        char *buffer = ogg_sync_buffer(&sync_, static_cast<long>(chunk));
        if (buffer == nullptr) {
            throw TafError(TafErrorKind::IoError, "ogg_sync_buffer failed for " +
                                                      std::to_string(chunk) + " bytes");
        }
        std::memcpy(buffer, data_ + fed_, chunk);
        if (ogg_sync_wrote(&sync_, static_cast<long>(chunk)) != 0) {
            throw TafError(TafErrorKind::IoError, "ogg_sync_wrote rejected the input chunk");
        }
        fed_ += chunk;
        TF_LOG("debug", "ogg sync: fed " << chunk << " bytes (" << fed_ << "/" << size_ << ")");
    }
}
