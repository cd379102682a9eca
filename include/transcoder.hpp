//
//  transcoder.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

inline constexpr uint32_t kDefaultBitrateKbps = 96;

// Backend turning an arbitrary audio file into an Ogg Opus byte stream
// (stereo, 48 kHz). Failures throw TafError(EncodeError).
class Transcoder {
   public:
    virtual ~Transcoder() = default;

    virtual std::vector<uint8_t> to_ogg_opus(const std::string &path) = 0;
};

struct TranscodeSettings {
    uint32_t bitrate_kbps = kDefaultBitrateKbps;
    bool vbr = true;
};

// Runs ffmpeg with libopus and captures the Ogg stream from its stdout.
class FfmpegTranscoder : public Transcoder {
   public:
    FfmpegTranscoder(std::string ffmpeg_path, TranscodeSettings settings)
        : ffmpeg_path_(std::move(ffmpeg_path)), settings_(settings) {}

    std::vector<uint8_t> to_ogg_opus(const std::string &path) override;

    // Full shell command line for one input.
    std::string command_line(const std::string &path) const;

   private:
    std::string ffmpeg_path_;
    TranscodeSettings settings_;
};

// Single-quote a string for /bin/sh.
std::string shell_quote(const std::string &s);
