//
//  tafforge.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "tafforge.hpp"
#include "tafforge_version.hpp"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

#include "extractor.hpp"
#include "input_files.hpp"
#include "logging.hpp"
#include "opus_packet.hpp"
#include "opus_source.hpp"
#include "taf_reader.hpp"

namespace {

void write_bytes(const std::filesystem::path &p, const std::vector<uint8_t> &data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw TafError(TafErrorKind::IoError, "open failed for " + p.string() + " (" +
                                                  std::generic_category().message(errno) + ")");
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw TafError(TafErrorKind::IoError, "write failed for " + p.string());
    }
}

std::string chapter_file_name(const std::string &stem, size_t chapter, size_t count) {
    if (count == 1) {
        return stem + ".ogg";
    }
    std::ostringstream name;
    name << std::setw(2) << std::setfill('0') << (chapter + 1) << "_" << stem << ".ogg";
    return name.str();
}

}  // namespace

namespace tafforge {

std::string version_string() { return TAFFORGE_VERSION_DISPLAY; }

namespace {

TafStatus make_status(TafErrorKind kind, std::string msg) {
    return TafStatus{kind == TafErrorKind::None, kind, std::move(msg)};
}

// Run `fn`, mapping whatever it throws onto a status.
template <typename Fn>
TafStatus guarded(const char *what, Fn &&fn) {
    try {
        fn();
        return make_status(TafErrorKind::None, {});
    } catch (const TafError &e) {
        TF_LOG("debug", what << " failed: " << taf_error_kind_name(e.kind()) << ": " << e.what());
        return make_status(e.kind(), e.what());
    } catch (const std::filesystem::filesystem_error &e) {
        TF_LOG("debug", what << " failed: " << e.what());
        return make_status(TafErrorKind::IoError, e.what());
    } catch (const std::exception &e) {
        TF_LOG("debug", what << " failed: " << e.what());
        return make_status(TafErrorKind::EncodeError, e.what());
    }
}

}  // namespace

std::optional<uint32_t> parse_timestamp(const std::string &text) {
    int base = 10;
    size_t start = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        start = 2;
    }
    if (start >= text.size()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    const char *first = text.data() + start;
    const char *last = text.data() + text.size();
    const auto res = std::from_chars(first, last, value, base);
    if (res.ec != std::errc() || res.ptr != last || value > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

std::string resolve_output_path(const std::string &output, const ConvertOptions &options) {
    if (output.empty()) {
        return options.default_output_name;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(output, ec)) {
        return (std::filesystem::path(output) / options.default_output_name).string();
    }
    return output;
}

ConvertResult convert_to_taf(const std::vector<std::string> &inputs,
                             const std::string &output_path, Transcoder &transcoder,
                             const ConvertOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    ConvertResult result;
    result.output_path = resolve_output_path(output_path, options);
    const std::string part_path = result.output_path + ".part";
    TF_LOG("debug", "convert_to_taf inputs=" << inputs.size() << " output=" << result.output_path
                                             << " discipline="
                                             << write_discipline_name(options.discipline));

    result.status = guarded("convert", [&] {
        if (inputs.empty()) {
            throw TafError(TafErrorKind::InvalidArgument, "no input files");
        }
        const uint32_t audio_id = options.timestamp
                                      ? *options.timestamp
                                      : static_cast<uint32_t>(std::time(nullptr));
        OpusSourceOptions source_options;
        source_options.celt_only = options.celt_only;
        OggOpusPacketSource source(inputs, transcoder, source_options);

        PageMuxerConfig config;
        config.max_page_size = options.max_page_size;
        config.stream_headers = source.stream_headers();

        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw TafError(TafErrorKind::IoError,
                           "open failed for " + part_path + " (" +
                               std::generic_category().message(errno) + ")");
        }
        TafWriter writer(out, options.discipline);
        auto written = writer.write(source, std::move(config), audio_id);
        out.close();
        if (!out) {
            throw TafError(TafErrorKind::IoError, "closing " + part_path + " failed");
        }
        std::filesystem::rename(part_path, result.output_path);

        result.header = std::move(written.header);
        result.page_count = written.page_count;
        result.total_granule = written.total_granule;
        result.track_count = source.tracks_opened();
    });

    if (!result.status.ok) {
        std::error_code ec;
        std::filesystem::remove(part_path, ec);
        if (ec) {
            TF_LOG("warn", "could not remove partial output " << part_path << ": " << ec.message());
        }
        return result;
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    TF_LOG("info", "converted " << result.track_count << " tracks into " << result.output_path
                                << " (" << (result.total_granule / kOpusSampleRate) << " s, " << ms
                                << " ms)");
    return result;
}

ConvertResult convert_to_taf(const std::string &input_path, const std::string &output_path,
                             const ConvertOptions &options) {
    std::vector<std::string> inputs;
    ConvertResult result;
    result.status = guarded("input discovery", [&] { inputs = filter_input_files(input_path); });
    if (!result.status.ok) {
        result.output_path = resolve_output_path(output_path, options);
        return result;
    }
    FfmpegTranscoder transcoder(options.ffmpeg_path,
                                TranscodeSettings{options.bitrate_kbps, options.vbr});
    return convert_to_taf(inputs, output_path, transcoder, options);
}

ExtractResult extract_taf(const std::string &input_file, const std::string &output_dir,
                          std::optional<size_t> chapter) {
    ExtractResult result;
    result.status = guarded("extract", [&] {
        const TafHandle handle = TafReader::open_file(input_file);
        const std::filesystem::path dir =
            output_dir.empty() ? std::filesystem::current_path() : std::filesystem::path(output_dir);
        std::filesystem::create_directories(dir);

        const std::string stem = std::filesystem::path(input_file).stem().string();
        const size_t count = chapter_count(handle);
        std::vector<size_t> selected;
        if (chapter) {
            selected.push_back(*chapter);
        } else {
            for (size_t k = 0; k < count; ++k) {
                selected.push_back(k);
            }
        }
        for (size_t k : selected) {
            const auto data =
                (count == 1 && !chapter) ? extract_audio(handle) : extract_audio(handle, k);
            const auto path = dir / chapter_file_name(stem, k, count);
            write_bytes(path, data);
            result.written.push_back(path.string());
            TF_LOG("info", "wrote " << path.string() << " (" << data.size() << " bytes)");
        }
    });
    return result;
}

InfoResult read_taf_info(const std::string &input_file) {
    InfoResult result;
    result.status = guarded("info", [&] {
        const TafHandle handle = TafReader::open_file(input_file, false);
        TafInfo &info = result.info;
        const TafHeader &h = handle.header();
        info.audio_id = h.audio_id;
        info.sha1_hash = hex_string(h.sha1_hash);
        info.computed_hash = hex_string(handle.computed_hash());
        info.hash_ok = handle.hash_verified();
        info.num_bytes = h.num_bytes;
        info.header_length = handle.header_length();
        info.fill_bytes = h.fill_bytes;
        info.chapter_pages = h.track_page_nums;

        auto cursor = handle.pages();
        while (auto page = cursor.next()) {
            if (page->granule_position != std::numeric_limits<uint64_t>::max()) {
                info.total_granule = page->granule_position;
            }
        }
        info.page_count = cursor.pages_read();
        info.damaged_regions = cursor.damaged_regions();
        info.duration_seconds = static_cast<double>(info.total_granule) / kOpusSampleRate;

        if (!info.hash_ok) {
            throw TafError(TafErrorKind::HashMismatch,
                           "embedded SHA-1 " + info.sha1_hash + " does not match audio region " +
                               info.computed_hash);
        }
    });
    return result;
}

}  // namespace tafforge

#ifdef TAFFORGE_TESTING
std::string chapter_file_name_for_test(const std::string &stem, size_t chapter, size_t count) {
    return chapter_file_name(stem, chapter, count);
}
#endif
