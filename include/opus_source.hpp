//
//  opus_source.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "audio_packet.hpp"
#include "ogg_demuxer.hpp"
#include "transcoder.hpp"

inline constexpr const char *kOpusVendor = "TafForge";

struct OpusSourceOptions {
    bool celt_only = true;  // the device decodes CELT frames only
    std::string vendor = kOpusVendor;
};

// Packet source over one or more input files, each becoming one chapter. Inputs ending in
// .opus are read as-is; everything else goes through the transcoder. Tracks are loaded one
// at a time as packets are pulled. Throws TafError(EncodeError) for streams the device
// cannot play and for a track without audio packets (it would have no page to start its
// chapter on), TafError(IoError) for unreadable .opus inputs.
class OggOpusPacketSource : public PacketSource {
   public:
    OggOpusPacketSource(std::vector<std::string> inputs, Transcoder &transcoder,
                        OpusSourceOptions options = {});

    // OpusHead of the first input and a generated OpusTags naming it. Loads the first
    // track when it is not loaded yet.
    std::vector<std::vector<uint8_t>> stream_headers();

    std::optional<AudioPacket> next_packet() override;
    const std::set<size_t> &chapter_boundaries() const override { return boundaries_; }

    size_t tracks_opened() const { return next_input_; }

   private:
    bool open_next_track();

    std::vector<std::string> inputs_;
    Transcoder &transcoder_;
    OpusSourceOptions options_;
    size_t next_input_ = 0;
    std::unique_ptr<OggPacketReader> reader_;
    std::string track_label_;
    size_t track_start_ = 0;  // index of the current track's first packet
    std::vector<uint8_t> first_head_;
    std::set<size_t> boundaries_;
    size_t emitted_ = 0;
};
