//
//  opus_packet.hpp
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

inline constexpr uint32_t kOpusSampleRate = 48000;
inline constexpr uint8_t kOpusChannels = 2;

// Identification header fields we validate (RFC 7845 section 5.1).
struct OpusHead {
    uint8_t version = 0;
    uint8_t channels = 0;
    uint16_t pre_skip = 0;
    uint32_t input_sample_rate = 0;
    int16_t output_gain = 0;
    uint8_t mapping_family = 0;
};

std::optional<OpusHead> parse_opus_head(const std::vector<uint8_t> &packet);

// Stereo, 48 kHz, version 1: the only layout the device plays. Returns an empty string
// when acceptable, otherwise the reason.
std::string check_opus_head(const OpusHead &head);

bool is_opus_tags(const std::vector<uint8_t> &packet);

// Comment header with the given vendor string and user comments ("KEY=value").
std::vector<uint8_t> build_opus_tags(const std::string &vendor,
                                     const std::vector<std::string> &comments);

// Configuration number from the TOC byte (0..31).
inline uint8_t opus_toc_config(uint8_t toc) { return toc >> 3; }

// CELT-only configurations are 16..31.
inline bool opus_config_is_celt(uint8_t config) { return config >= 16; }

// Samples at 48 kHz for one frame of the given configuration (RFC 6716 section 3.1).
uint32_t opus_frame_samples(uint8_t config);

// Total samples in a packet from its TOC byte and frame count code. std::nullopt for an
// empty packet or a code-3 packet without its frame count byte.
std::optional<uint32_t> opus_packet_samples(const uint8_t *data, size_t size);

// Rewrite a packet as a code-3 packet of exactly `target` bytes (RFC 6716 section 3.2.5).
// Code 0..2 packets are converted to the equivalent code-3 framing; padding already present
// in a code-3 packet is replaced. Every target >= packet.size() is reachable; std::nullopt
// for a packet that cannot be parsed or a target below its unpadded code-3 size.
std::optional<std::vector<uint8_t>> opus_pad_packet(const std::vector<uint8_t> &packet,
                                                    size_t target);
