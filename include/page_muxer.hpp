//
//  page_muxer.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <vector>

#include "audio_packet.hpp"
#include "ogg_page.hpp"

inline constexpr size_t kDefaultMaxPageSize = 4096;

struct PageMuxerConfig {
    size_t max_page_size = kDefaultMaxPageSize;  // header + lacing + payload
    uint32_t serial_no = 0;
    // Codec setup packets (OpusHead, OpusTags); each goes alone on a granule-0 page.
    std::vector<std::vector<uint8_t>> stream_headers;
    // Grow audio pages to exactly max_page_size with Opus padding. The first audio page is
    // shortened so that it ends on a max_page_size boundary of the stream, which puts every
    // later page on one. The trailing empty page of a stream without audio is not padded.
    bool pad_pages = true;
};

// Pull-style packet-to-page grouping. Every call to next_page() returns one finished page
// with its sequence number assigned; the packet source is consumed lazily with one packet
// of lookahead so the final page can carry EOS.
//
// With pad_pages every audio page is filled to its capacity by rewriting packets as padded
// code-3 Opus packets; a page that cannot be filled throws TafError(EncodeError).
//
// A chapter boundary at packet i > 0 seals the current page and records the sequence number
// of the page that receives packet i. chapter_marks() always starts with page 0 and is only
// complete once next_page() has returned std::nullopt.
class PageMuxer {
   public:
    PageMuxer(PacketSource &source, PageMuxerConfig config);

    // Throws TafError(EncodeError) for a packet that cannot fit an empty page.
    std::optional<OggPage> next_page();

    const std::vector<uint32_t> &chapter_marks() const { return marks_; }
    uint64_t total_granule() const { return granule_; }
    size_t packet_count() const { return packets_seen_; }
    uint32_t page_count() const { return next_seq_; }

   private:
    bool fetch();
    size_t page_capacity() const;
    bool fits(const AudioPacket &pkt) const;
    void pad(OggPage &page) const;
    OggPage seal(OggPage page, uint64_t granule);
    OggPage take_page();
    void warn_unused_boundaries() const;

    PacketSource &source_;
    PageMuxerConfig config_;
    size_t header_pos_ = 0;
    std::optional<AudioPacket> lookahead_;
    bool exhausted_ = false;
    bool finished_ = false;
    uint32_t next_seq_ = 0;
    uint64_t bytes_out_ = 0;  // serialized size of all sealed pages
    uint64_t granule_ = 0;
    size_t packets_seen_ = 0;  // packets pulled from the source so far
    size_t lookahead_index_ = 0;
    std::vector<uint32_t> marks_{0};

    OggPage page_;
    size_t page_lacing_ = 0;
    size_t page_body_ = 0;
};

struct MuxResult {
    std::vector<OggPage> pages;
    std::vector<uint32_t> chapter_marks;
    uint64_t total_granule = 0;
};

// Convenience: drain a PageMuxer over an in-memory packet list.
MuxResult mux_packets(std::vector<AudioPacket> packets, std::set<size_t> boundaries,
                      const PageMuxerConfig &config);
