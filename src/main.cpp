//
//  main.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "tafforge.hpp"
#include "tafforge_version.hpp"
#include <nlohmann/json.hpp>

namespace {

void print_usage() {
    std::cerr << "TafForge " << TAFFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "usage:\n"
              << "  tafforge convert <input_path> [output_file] [--ffmpeg PATH] "
              << "[--timestamp N|0xHEX] [--bitrate KBPS] [--cbr] [--spool]\n"
              << "  tafforge extract <input_file> [output_directory] [--chapter N]\n"
              << "  tafforge info <input_file>\n"
              << "  tafforge --version\n"
              << "Options:\n"
              << "  --ffmpeg PATH       ffmpeg executable used for transcoding (default: ffmpeg).\n"
              << "  --timestamp VALUE   Audio id written to the header (default: current time).\n"
              << "  --bitrate KBPS      Opus bitrate (default: 96).\n"
              << "  --cbr               Constant bitrate encoding.\n"
              << "  --spool             Buffer pages in memory instead of patching the header.\n"
              << "  --chapter N         Extract only chapter N (1-based).\n"
              << "  --log-level LEVEL   Set logging verbosity: error|warn|info|debug (default: info).\n"
              << "\n"
              << "<input_path> is an audio file, a directory of audio files or a .json playlist\n"
              << "({\"tracks\": [...]}); each file becomes one chapter. [output_file] defaults to "
              << tafforge::kDefaultOutputName << ".\n";
}

std::optional<uint32_t> parse_u32(const std::string &s) {
    uint32_t v = 0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

int report(const char *what, const tafforge::TafStatus &status) {
    TF_LOG("error", "tafforge: " << what << " failed: " << taf_error_kind_name(status.error) << ": "
                                 << status.message);
    return 1;
}

void emit_info_json(const tafforge::InfoResult &res) {
    const auto &info = res.info;
    nlohmann::json j;
    j["valid"] = res.status.ok;
    if (!res.status.ok) {
        j["error"] = taf_error_kind_name(res.status.error);
        j["message"] = res.status.message;
    }
    j["audio_id"] = info.audio_id;
    j["sha1"] = info.sha1_hash;
    j["sha1_computed"] = info.computed_hash;
    j["hash_ok"] = info.hash_ok;
    j["num_bytes"] = info.num_bytes;
    j["header_length"] = info.header_length;
    j["fill_bytes"] = info.fill_bytes;
    j["chapters"] = info.chapter_pages;
    j["pages"] = info.page_count;
    j["damaged_regions"] = info.damaged_regions;
    j["granule"] = info.total_granule;
    j["duration_seconds"] = info.duration_seconds;
    std::cout << j.dump(2) << "\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "TafForge " << TAFFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    tafforge::ConvertOptions options;
    std::optional<size_t> chapter;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--log-level" && has_value) {
            tafforge::set_log_verbosity(tafforge::parse_log_verbosity(argv[++i]));
        } else if (arg == "--ffmpeg" && has_value) {
            options.ffmpeg_path = argv[++i];
        } else if (arg == "--timestamp" && has_value) {
            auto ts = tafforge::parse_timestamp(argv[++i]);
            if (!ts) {
                std::cerr << "Invalid timestamp: " << argv[i] << "\n";
                return 2;
            }
            options.timestamp = ts;
        } else if (arg == "--bitrate" && has_value) {
            auto kbps = parse_u32(argv[++i]);
            if (!kbps || *kbps == 0) {
                std::cerr << "Invalid bitrate: " << argv[i] << "\n";
                return 2;
            }
            options.bitrate_kbps = *kbps;
        } else if (arg == "--chapter" && has_value) {
            auto n = parse_u32(argv[++i]);
            if (!n || *n == 0) {
                std::cerr << "Invalid chapter: " << argv[i] << " (chapters count from 1)\n";
                return 2;
            }
            chapter = static_cast<size_t>(*n - 1);
        } else if (arg == "--cbr") {
            options.vbr = false;
        } else if (arg == "--spool") {
            options.discipline = WriteDiscipline::Spool;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() < 2) {
        print_usage();
        return 2;
    }
    const std::string command = positional[0];

    if (command == "convert") {
        if (positional.size() > 3) {
            std::cerr << "Invalid arguments. See usage with no arguments.\n";
            return 2;
        }
        const std::string output = positional.size() == 3 ? positional[2] : std::string();
        auto res = tafforge::convert_to_taf(positional[1], output, options);
        if (!res.status.ok) {
            return report("convert", res.status);
        }
        std::cout << "Wrote: " << res.output_path << "\n";
        return 0;
    }

    if (command == "extract") {
        if (positional.size() > 3) {
            std::cerr << "Invalid arguments. See usage with no arguments.\n";
            return 2;
        }
        const std::string output_dir = positional.size() == 3 ? positional[2] : std::string();
        auto res = tafforge::extract_taf(positional[1], output_dir, chapter);
        if (!res.status.ok) {
            return report("extract", res.status);
        }
        for (const auto &path : res.written) {
            std::cout << "Wrote: " << path << "\n";
        }
        return 0;
    }

    if (command == "info") {
        if (positional.size() != 2) {
            std::cerr << "Invalid arguments. See usage with no arguments.\n";
            return 2;
        }
        auto res = tafforge::read_taf_info(positional[1]);
        emit_info_json(res);
        if (!res.status.ok) {
            return report("info", res.status);
        }
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 2;
}
