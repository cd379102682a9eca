//
//  opus_packet.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "opus_packet.hpp"

#include <cstring>

#include "byte_io.hpp"

namespace {

constexpr size_t kOpusHeadMinSize = 19;
constexpr char kOpusHeadMagic[8] = {'O', 'p', 'u', 's', 'H', 'e', 'a', 'd'};
constexpr char kOpusTagsMagic[8] = {'O', 'p', 'u', 's', 'T', 'a', 'g', 's'};

constexpr uint8_t kCodeMask = 0x03;
constexpr uint8_t kCountVbr = 0x80;
constexpr uint8_t kCountPadding = 0x40;
constexpr uint8_t kCountFrames = 0x3F;

// The same frames as an unpadded code-3 packet.
std::optional<std::vector<uint8_t>> unpadded_code3(const std::vector<uint8_t> &packet) {
    if (packet.empty()) {
        return std::nullopt;
    }
    const uint8_t toc = packet[0] | kCodeMask;
    std::vector<uint8_t> out;
    switch (packet[0] & kCodeMask) {
        case 0:
            out = {toc, 0x01};
            break;
        case 1:
            out = {toc, 0x02};
            break;
        case 2:
            if (packet.size() < 2) {
                return std::nullopt;
            }
            out = {toc, kCountVbr | 0x02};
            break;
        default: {
            if (packet.size() < 2 || (packet[1] & kCountFrames) == 0) {
                return std::nullopt;
            }
            const uint8_t count = packet[1];
            size_t pos = 2;
            size_t padding = 0;
            if (count & kCountPadding) {
                while (true) {
                    if (pos >= packet.size()) {
                        return std::nullopt;
                    }
                    const uint8_t b = packet[pos++];
                    if (b == 255) {
                        padding += 254;
                    } else {
                        padding += b;
                        break;
                    }
                }
            }
            if (pos + padding > packet.size()) {
                return std::nullopt;
            }
            out = {toc, static_cast<uint8_t>(count & ~kCountPadding)};
            out.insert(out.end(), packet.begin() + pos, packet.end() - padding);
            return out;
        }
    }
    out.insert(out.end(), packet.begin() + 1, packet.end());
    return out;
}

}  // namespace

std::optional<OpusHead> parse_opus_head(const std::vector<uint8_t> &packet) {
    if (packet.size() < kOpusHeadMinSize ||
        std::memcmp(packet.data(), kOpusHeadMagic, sizeof(kOpusHeadMagic)) != 0) {
        return std::nullopt;
    }
    OpusHead head;
    head.version = packet[8];
    head.channels = packet[9];
    head.pre_skip = read_u16_le(packet.data() + 10);
    head.input_sample_rate = read_u32_le(packet.data() + 12);
    head.output_gain = static_cast<int16_t>(read_u16_le(packet.data() + 16));
    head.mapping_family = packet[18];
    return head;
}

std::string check_opus_head(const OpusHead &head) {
    if (head.version != 1) {
        return "unsupported OpusHead version " + std::to_string(head.version);
    }
    if (head.channels != kOpusChannels) {
        return "only stereo streams are supported (got " + std::to_string(head.channels) +
               " channels)";
    }
    if (head.input_sample_rate != kOpusSampleRate) {
        return "sample rate needs to be 48 kHz (got " + std::to_string(head.input_sample_rate) +
               ")";
    }
    return {};
}

bool is_opus_tags(const std::vector<uint8_t> &packet) {
    return packet.size() >= sizeof(kOpusTagsMagic) &&
           std::memcmp(packet.data(), kOpusTagsMagic, sizeof(kOpusTagsMagic)) == 0;
}

std::vector<uint8_t> build_opus_tags(const std::string &vendor,
                                     const std::vector<std::string> &comments) {
    std::vector<uint8_t> p(kOpusTagsMagic, kOpusTagsMagic + sizeof(kOpusTagsMagic));
    write_u32_le(p, static_cast<uint32_t>(vendor.size()));
    p.insert(p.end(), vendor.begin(), vendor.end());
    write_u32_le(p, static_cast<uint32_t>(comments.size()));
    for (const auto &c : comments) {
        write_u32_le(p, static_cast<uint32_t>(c.size()));
        p.insert(p.end(), c.begin(), c.end());
    }
    return p;
}

uint32_t opus_frame_samples(uint8_t config) {
    // Durations in units of 2.5 ms (120 samples at 48 kHz).
    static const uint32_t kSilk[4] = {4, 8, 16, 24};  // 10, 20, 40, 60 ms
    static const uint32_t kHybrid[2] = {4, 8};        // 10, 20 ms
    static const uint32_t kCelt[4] = {1, 2, 4, 8};    // 2.5, 5, 10, 20 ms
    uint32_t units = 0;
    if (config < 12) {
        units = kSilk[config % 4];
    } else if (config < 16) {
        units = kHybrid[config % 2];
    } else {
        units = kCelt[config % 4];
    }
    return units * 120;
}

std::optional<uint32_t> opus_packet_samples(const uint8_t *data, size_t size) {
    if (size == 0) {
        return std::nullopt;
    }
    const uint8_t toc = data[0];
    uint32_t frames = 0;
    switch (toc & 0x3) {
        case 0:
            frames = 1;
            break;
        case 1:
        case 2:
            frames = 2;
            break;
        default:
            if (size < 2) {
                return std::nullopt;
            }
            frames = data[1] & 0x3F;
            break;
    }
    return frames * opus_frame_samples(opus_toc_config(toc));
}

std::optional<std::vector<uint8_t>> opus_pad_packet(const std::vector<uint8_t> &packet,
                                                    size_t target) {
    if (target == packet.size()) {
        return packet;
    }
    auto base = unpadded_code3(packet);
    if (!base || target < base->size()) {
        return std::nullopt;
    }
    if (target == base->size()) {
        return base;
    }
    // Length bytes: a run of 255s (254 padding bytes each) and one final value 0..254.
    const size_t extra = target - base->size();
    const size_t runs = (extra - 1) / 255;
    const size_t last = extra - 1 - 255 * runs;
    std::vector<uint8_t> out;
    out.reserve(target);
    out.push_back((*base)[0]);
    out.push_back((*base)[1] | kCountPadding);
    out.insert(out.end(), runs, 255);
    out.push_back(static_cast<uint8_t>(last));
    out.insert(out.end(), base->begin() + 2, base->end());
    out.resize(target, 0);
    return out;
}
