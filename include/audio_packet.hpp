//
//  audio_packet.hpp
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
#include <utility>
#include <vector>

// One encoded audio frame. Duration is in the codec's native unit (48 kHz samples for Opus).
struct AudioPacket {
    std::vector<uint8_t> data;
    uint64_t duration = 0;
    size_t index = 0;  // ordinal within the stream, 0-based
};

// Ordered, finite producer of packets plus the packet indices that begin a new chapter.
// Implementations may discover boundaries while producing; a boundary for packet i must be
// visible by the time next_packet() returns packet i.
class PacketSource {
   public:
    virtual ~PacketSource() = default;

    virtual std::optional<AudioPacket> next_packet() = 0;
    virtual const std::set<size_t> &chapter_boundaries() const = 0;
};

// In-memory source; packet indices are reassigned to their position in the vector.
class VectorPacketSource : public PacketSource {
   public:
    VectorPacketSource(std::vector<AudioPacket> packets, std::set<size_t> boundaries = {})
        : packets_(std::move(packets)), boundaries_(std::move(boundaries)) {}

    std::optional<AudioPacket> next_packet() override {
        if (pos_ >= packets_.size()) {
            return std::nullopt;
        }
        AudioPacket p = std::move(packets_[pos_]);
        p.index = pos_++;
        return p;
    }

    const std::set<size_t> &chapter_boundaries() const override { return boundaries_; }

   private:
    std::vector<AudioPacket> packets_;
    std::set<size_t> boundaries_;
    size_t pos_ = 0;
};
