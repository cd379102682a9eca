//
//  opus_source.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "opus_source.hpp"

#include <cctype>
#include <filesystem>
#include <utility>

#include "logging.hpp"
#include "opus_packet.hpp"
#include "taf_error.hpp"
#include "taf_reader.hpp"

namespace {

bool has_opus_extension(const std::string &path) {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return ext == ".opus";
}

std::string file_name_of(const std::string &path) {
    return std::filesystem::path(path).filename().string();
}

}  // namespace

OggOpusPacketSource::OggOpusPacketSource(std::vector<std::string> inputs,
                                         Transcoder &transcoder, OpusSourceOptions options)
    : inputs_(std::move(inputs)), transcoder_(transcoder), options_(std::move(options)) {}

bool OggOpusPacketSource::open_next_track() {
    if (next_input_ >= inputs_.size()) {
        return false;
    }
    const size_t track = next_input_++;
    const std::string &path = inputs_[track];
    const std::string label = file_name_of(path);
    std::vector<uint8_t> bytes =
        has_opus_extension(path) ? read_file_bytes(path) : transcoder_.to_ogg_opus(path);
    reader_ = std::make_unique<OggPacketReader>(std::move(bytes), label);

    auto head_packet = reader_->next_packet();
    if (!head_packet) {
        throw TafError(TafErrorKind::EncodeError, label + ": no Ogg packets found");
    }
    auto head = parse_opus_head(*head_packet);
    if (!head) {
        throw TafError(TafErrorKind::EncodeError, label + ": first packet is not an OpusHead");
    }
    const std::string problem = check_opus_head(*head);
    if (!problem.empty()) {
        throw TafError(TafErrorKind::EncodeError, label + ": " + problem);
    }
    auto tags_packet = reader_->next_packet();
    if (!tags_packet || !is_opus_tags(*tags_packet)) {
        throw TafError(TafErrorKind::EncodeError, label + ": OpusTags header missing");
    }

    if (track == 0) {
        first_head_ = std::move(*head_packet);
    } else {
        boundaries_.insert(emitted_);
    }
    track_label_ = label;
    track_start_ = emitted_;
    TF_LOG("info", "track " << (track + 1) << "/" << inputs_.size() << ": " << label
                            << " (pre-skip " << head->pre_skip << ", starts at packet "
                            << emitted_ << ")");
    return true;
}

std::vector<std::vector<uint8_t>> OggOpusPacketSource::stream_headers() {
    if (inputs_.empty()) {
        throw TafError(TafErrorKind::InvalidArgument, "no input files");
    }
    if (next_input_ == 0 && !open_next_track()) {
        throw TafError(TafErrorKind::EncodeError, "could not open first input");
    }
    std::vector<std::string> comments = {"TITLE=" + file_name_of(inputs_.front())};
    return {first_head_, build_opus_tags(options_.vendor, comments)};
}

std::optional<AudioPacket> OggOpusPacketSource::next_packet() {
    while (true) {
        if (!reader_ && !open_next_track()) {
            return std::nullopt;
        }
        auto data = reader_->next_packet();
        if (!data) {
            if (emitted_ == track_start_) {
                throw TafError(TafErrorKind::EncodeError,
                               track_label_ + ": no audio packets after the stream headers");
            }
            reader_.reset();
            continue;
        }
        if (data->empty()) {
            TF_LOG("warn", "skipping empty packet after packet " << emitted_);
            continue;
        }
        const auto samples = opus_packet_samples(data->data(), data->size());
        if (!samples) {
            throw TafError(TafErrorKind::EncodeError,
                           "malformed Opus packet " + std::to_string(emitted_));
        }
        const uint8_t config = opus_toc_config((*data)[0]);
        if (options_.celt_only && !opus_config_is_celt(config)) {
            throw TafError(TafErrorKind::EncodeError,
                           "Opus packet " + std::to_string(emitted_) + " uses configuration " +
                               std::to_string(config) +
                               "; only CELT frames (16-31) are supported, encode with "
                               "-application lowdelay");
        }
        AudioPacket pkt;
        pkt.data = std::move(*data);
        pkt.duration = *samples;
        pkt.index = emitted_++;
        return pkt;
    }
}
