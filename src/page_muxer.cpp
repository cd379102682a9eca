//
//  page_muxer.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "page_muxer.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "logging.hpp"
#include "opus_packet.hpp"
#include "taf_error.hpp"

namespace {

// Payload plus lacing values of a packet that ends on the page.
size_t laced_size(size_t n) { return n + lacing_values_for(n); }

// Packet size with the given laced size. Laced sizes that are multiples of 256 are skipped
// by every packet size.
std::optional<size_t> size_for_laced(size_t laced) {
    if (laced == 0 || laced % 256 == 0) {
        return std::nullopt;
    }
    return (laced - 1) / 256 * 255 + (laced - 1) % 256;
}

// Target packet sizes that add exactly `extra` bytes to a page using at most `lacing_spare`
// further lacing values. Prefers growing only the last packet; otherwise fills each packet
// up to the end of its lacing band, last first, and lets the last packet cross bands.
std::optional<std::vector<size_t>> plan_padding(const std::vector<size_t> &sizes, size_t extra,
                                                size_t lacing_spare) {
    std::vector<size_t> targets = sizes;
    if (extra == 0) {
        return targets;
    }
    if (sizes.empty()) {
        return std::nullopt;
    }
    const size_t last = sizes.size() - 1;

    auto grow_across = [&](size_t i, size_t by) {
        const auto q = size_for_laced(laced_size(targets[i]) + by);
        if (!q) {
            return false;
        }
        const size_t added = lacing_values_for(*q) - lacing_values_for(targets[i]);
        if (added > lacing_spare) {
            return false;
        }
        lacing_spare -= added;
        targets[i] = *q;
        return true;
    };

    if (grow_across(last, extra)) {
        return targets;
    }

    size_t remaining = extra;
    std::vector<size_t> grown(sizes.size(), 0);
    for (size_t i = sizes.size(); i-- > 0 && remaining > 0;) {
        grown[i] = std::min<size_t>(254 - targets[i] % 255, remaining);
        targets[i] += grown[i];
        remaining -= grown[i];
    }
    if (remaining == 0) {
        return targets;
    }

    // Every packet now ends its band (laced size 255 mod 256); the last packet takes the
    // rest unless that lands on a multiple of 256.
    if (remaining % 256 == 1) {
        bool handed_back = false;
        for (size_t i = 0; i < last && !handed_back; ++i) {
            if (grown[i] > 0) {
                --targets[i];
                ++remaining;
                handed_back = true;
            }
        }
        if (!handed_back) {
            for (size_t i = 0; i < last && !handed_back; ++i) {
                if (remaining > 2 && grow_across(i, 2)) {
                    remaining -= 2;
                    handed_back = true;
                }
            }
        }
        if (!handed_back) {
            return std::nullopt;
        }
    }
    if (grow_across(last, remaining)) {
        return targets;
    }
    return std::nullopt;
}

}  // namespace

PageMuxer::PageMuxer(PacketSource &source, PageMuxerConfig config)
    : source_(source), config_(std::move(config)) {
    if (config_.max_page_size <= kOggPageHeaderSize) {
        throw TafError(TafErrorKind::InvalidArgument,
                       "page capacity " + std::to_string(config_.max_page_size) +
                           " cannot hold any payload");
    }
}

bool PageMuxer::fetch() {
    if (lookahead_ || exhausted_) {
        return lookahead_.has_value();
    }
    lookahead_ = source_.next_packet();
    if (!lookahead_) {
        exhausted_ = true;
        return false;
    }
    lookahead_index_ = packets_seen_++;
    return true;
}

size_t PageMuxer::page_capacity() const {
    if (!config_.pad_pages) {
        return config_.max_page_size;
    }
    return config_.max_page_size - static_cast<size_t>(bytes_out_ % config_.max_page_size);
}

bool PageMuxer::fits(const AudioPacket &pkt) const {
    const size_t lacing = page_lacing_ + lacing_values_for(pkt.data.size());
    if (lacing > kOggMaxLacingValues) {
        return false;
    }
    return kOggPageHeaderSize + lacing + page_body_ + pkt.data.size() <= page_capacity();
}

void PageMuxer::pad(OggPage &page) const {
    const size_t capacity = page_capacity();
    const size_t unpadded = page.size();
    std::vector<size_t> sizes;
    for (const auto &p : page.packets) {
        sizes.push_back(p.size());
    }
    const auto targets = plan_padding(sizes, capacity - unpadded,
                                      kOggMaxLacingValues - page.lacing_count());
    if (!targets) {
        throw TafError(TafErrorKind::EncodeError,
                       "page " + std::to_string(next_seq_) + " (" + std::to_string(unpadded) +
                           " bytes, " + std::to_string(page.packets.size()) +
                           " packets) cannot be padded to " + std::to_string(capacity) + " bytes");
    }
    for (size_t i = 0; i < sizes.size(); ++i) {
        if ((*targets)[i] == sizes[i]) {
            continue;
        }
        auto padded = opus_pad_packet(page.packets[i], (*targets)[i]);
        if (!padded) {
            throw TafError(TafErrorKind::EncodeError,
                           "packet " + std::to_string(i) + " on page " +
                               std::to_string(next_seq_) +
                               " is not an Opus packet that can carry padding");
        }
        page.packets[i] = std::move(*padded);
    }
    TF_LOG("debug", "muxer: padded page " << next_seq_ << " from " << unpadded << " to "
                                          << page.size() << " bytes");
}

OggPage PageMuxer::seal(OggPage page, uint64_t granule) {
    page.serial_no = config_.serial_no;
    page.page_no = next_seq_++;
    page.granule_position = granule;
    if (page.page_no == 0) {
        page.header_type |= kOggFlagBos;
    }
    bytes_out_ += page.size();
    TF_LOG("debug", "muxer: sealed page " << page.page_no << " packets=" << page.packets.size()
                                          << " bytes=" << page.size() << " granule=" << granule
                                          << (page.eos() ? " eos" : ""));
    return page;
}

OggPage PageMuxer::take_page() {
    OggPage out = std::move(page_);
    page_ = OggPage{};
    page_lacing_ = 0;
    page_body_ = 0;
    if (config_.pad_pages) {
        pad(out);
    }
    return seal(std::move(out), granule_);
}

void PageMuxer::warn_unused_boundaries() const {
    for (size_t b : source_.chapter_boundaries()) {
        if (b >= packets_seen_) {
            TF_LOG("warn", "chapter boundary at packet " << b << " is past the last packet ("
                                                         << packets_seen_ << " packets); ignored");
        }
    }
}

std::optional<OggPage> PageMuxer::next_page() {
    if (finished_) {
        return std::nullopt;
    }

    if (header_pos_ < config_.stream_headers.size()) {
        OggPage page;
        page.packets.push_back(config_.stream_headers[header_pos_]);
        if (page.lacing_count() > kOggMaxLacingValues || page.size() > config_.max_page_size) {
            throw TafError(TafErrorKind::EncodeError,
                           "stream header packet " + std::to_string(header_pos_) + " (" +
                               std::to_string(page.body_size()) +
                               " bytes) exceeds page capacity " +
                               std::to_string(config_.max_page_size));
        }
        ++header_pos_;
        return seal(std::move(page), 0);
    }

    while (fetch()) {
        const size_t index = lookahead_index_;
        const bool page_empty = page_.packets.empty();
        if (index > 0 && source_.chapter_boundaries().count(index) != 0) {
            if (!page_empty) {
                return take_page();
            }
            if (marks_.back() != next_seq_) {
                marks_.push_back(next_seq_);
                TF_LOG("debug", "muxer: chapter " << marks_.size() << " starts at page "
                                                  << next_seq_ << " (packet " << index << ")");
            }
        }
        if (!fits(*lookahead_)) {
            if (page_empty) {
                throw TafError(TafErrorKind::EncodeError,
                               "packet " + std::to_string(index) + " (" +
                                   std::to_string(lookahead_->data.size()) +
                                   " bytes) exceeds page capacity " +
                                   std::to_string(page_capacity()));
            }
            return take_page();
        }
        page_lacing_ += lacing_values_for(lookahead_->data.size());
        page_body_ += lookahead_->data.size();
        granule_ += lookahead_->duration;
        page_.packets.push_back(std::move(lookahead_->data));
        lookahead_.reset();

        if (!fetch()) {
            page_.header_type |= kOggFlagEos;
            finished_ = true;
            warn_unused_boundaries();
            return take_page();
        }
    }

    // No audio packets at all: a lone empty final page.
    finished_ = true;
    warn_unused_boundaries();
    OggPage empty;
    empty.header_type = kOggFlagEos;
    return seal(std::move(empty), 0);
}

MuxResult mux_packets(std::vector<AudioPacket> packets, std::set<size_t> boundaries,
                      const PageMuxerConfig &config) {
    VectorPacketSource source(std::move(packets), std::move(boundaries));
    PageMuxer muxer(source, config);
    MuxResult result;
    while (auto page = muxer.next_page()) {
        result.pages.emplace_back(std::move(*page));
    }
    result.chapter_marks = muxer.chapter_marks();
    result.total_granule = muxer.total_granule();
    return result;
}
