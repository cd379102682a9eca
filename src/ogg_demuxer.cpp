//
//  ogg_demuxer.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ogg_demuxer.hpp"

#include <utility>

#include "logging.hpp"

OggPacketReader::OggPacketReader(std::vector<uint8_t> bytes, std::string label)
    : bytes_(std::move(bytes)), label_(std::move(label)), scanner_(bytes_.data(), bytes_.size()) {}

OggPacketReader::~OggPacketReader() {
    if (stream_ready_) {
        ogg_stream_clear(&stream_);
    }
}

bool OggPacketReader::load_page() {
    ogg_page page;
    size_t skipped = 0;
    while (true) {
        const bool found = scanner_.next_page(page, skipped);
        if (skipped > 0) {
            TF_LOG("warn", label_ << ": skipped " << skipped << " bytes to resync (consumed "
                                  << scanner_.consumed() << ")");
            bytes_skipped_ += skipped;
        }
        if (!found) {
            if (scanner_.pending() > 0) {
                TF_LOG("warn", label_ << ": " << scanner_.pending()
                                      << " trailing bytes do not form a page");
                bytes_skipped_ += scanner_.pending();
            }
            return false;
        }

        const int serial = ogg_page_serialno(&page);
        if (!stream_ready_) {
            if (ogg_stream_init(&stream_, serial) != 0) {
                TF_LOG("error", label_ << ": ogg_stream_init failed");
                return false;
            }
            stream_ready_ = true;
            TF_LOG("debug", label_ << ": logical stream serial " << static_cast<uint32_t>(serial));
        }
        if (serial != stream_.serialno) {
            TF_LOG("warn", label_ << ": page of stream " << static_cast<uint32_t>(serial)
                                  << " ignored");
            continue;
        }
        if (ogg_stream_pagein(&stream_, &page) != 0) {
            TF_LOG("warn", label_ << ": page " << ogg_page_pageno(&page) << " rejected (version "
                                  << ogg_page_version(&page) << ")");
            continue;
        }
        const int segments = page.header[26];
        open_tail_ = segments > 0 && page.header[kOggPageHeaderSize + segments - 1] == 255;
        ++pages_read_;
        return true;
    }
}

std::optional<std::vector<uint8_t>> OggPacketReader::next_packet() {
    while (true) {
        if (stream_ready_) {
            ogg_packet op;
            const int rc = ogg_stream_packetout(&stream_, &op);
            if (rc == 1) {
                return std::vector<uint8_t>(op.packet, op.packet + op.bytes);
            }
            if (rc < 0) {
                TF_LOG("warn", label_ << ": hole in the page sequence before page "
                                      << stream_.pageno << "; packet data lost");
                continue;
            }
        }
        if (!load_page()) {
            if (open_tail_) {
                TF_LOG("warn", label_ << ": stream ends inside a packet; its data is dropped");
                open_tail_ = false;
            }
            return std::nullopt;
        }
    }
}
