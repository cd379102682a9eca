//
//  input_files.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "input_files.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

#include "logging.hpp"
#include "taf_error.hpp"

using json = nlohmann::json;

namespace {

std::string lower_extension(const std::filesystem::path &p) {
    auto ext = p.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

}  // namespace

const std::vector<std::string> &supported_extensions() {
    static const std::vector<std::string> exts = {"mp3",  "aac", "wav", "ogg",
                                                  "webm", "opus", "m4a", "flac"};
    return exts;
}

bool is_supported_audio_file(const std::string &path) {
    const auto ext = lower_extension(path);
    const auto &exts = supported_extensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

bool natural_less(const std::string &a, const std::string &b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (is_digit(a[i]) && is_digit(b[j])) {
            size_t ie = i;
            size_t je = j;
            while (ie < a.size() && is_digit(a[ie])) ++ie;
            while (je < b.size() && is_digit(b[je])) ++je;
            // Compare values without leading zeros: longer run is bigger, then lexically.
            size_t is = i;
            size_t js = j;
            while (is + 1 < ie && a[is] == '0') ++is;
            while (js + 1 < je && b[js] == '0') ++js;
            const size_t alen = ie - is;
            const size_t blen = je - js;
            if (alen != blen) {
                return alen < blen;
            }
            const int cmp = a.compare(is, alen, b, js, blen);
            if (cmp != 0) {
                return cmp < 0;
            }
            i = ie;
            j = je;
            continue;
        }
        const int ca = ::tolower(static_cast<unsigned char>(a[i]));
        const int cb = ::tolower(static_cast<unsigned char>(b[j]));
        if (ca != cb) {
            return ca < cb;
        }
        ++i;
        ++j;
    }
    if ((a.size() - i) != (b.size() - j)) {
        return (a.size() - i) < (b.size() - j);
    }
    return a < b;
}

std::vector<std::string> load_playlist(const std::string &json_path) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        throw TafError(TafErrorKind::IoError, "open failed for " + json_path + " (" +
                                                  std::generic_category().message(errno) + ")");
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception &e) {
        throw TafError(TafErrorKind::IoError, "playlist " + json_path + ": " + e.what());
    }
    if (!j.is_object() || !j.contains("tracks") || !j["tracks"].is_array()) {
        throw TafError(TafErrorKind::InvalidArgument,
                       "playlist " + json_path + " has no \"tracks\" array");
    }
    const auto base = std::filesystem::path(json_path).parent_path();
    std::vector<std::string> out;
    for (const auto &t : j["tracks"]) {
        if (!t.is_string()) {
            throw TafError(TafErrorKind::InvalidArgument,
                           "playlist " + json_path + ": track entries must be strings");
        }
        std::filesystem::path p = t.get<std::string>();
        if (p.is_relative()) {
            p = base / p;
        }
        out.push_back(p.string());
    }
    if (out.empty()) {
        throw TafError(TafErrorKind::InvalidArgument, "playlist " + json_path + " is empty");
    }
    TF_LOG("debug", "playlist " << json_path << ": " << out.size() << " tracks");
    return out;
}

std::vector<std::string> filter_input_files(const std::string &input_path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path in(input_path);

    if (fs::is_regular_file(in, ec)) {
        if (lower_extension(in) == "json") {
            return load_playlist(input_path);
        }
        if (is_supported_audio_file(input_path)) {
            return {input_path};
        }
    } else if (fs::is_directory(in, ec)) {
        std::vector<fs::path> paths;
        for (const auto &entry : fs::directory_iterator(in, ec)) {
            if (entry.is_regular_file(ec) && is_supported_audio_file(entry.path().string())) {
                paths.push_back(entry.path());
            }
        }
        if (ec) {
            throw TafError(TafErrorKind::IoError,
                           "listing " + input_path + " failed: " + ec.message());
        }
        std::sort(paths.begin(), paths.end(), [](const fs::path &a, const fs::path &b) {
            return natural_less(a.filename().string(), b.filename().string());
        });
        std::vector<std::string> out;
        out.reserve(paths.size());
        for (const auto &p : paths) {
            out.push_back(p.string());
        }
        if (out.empty()) {
            throw TafError(TafErrorKind::InvalidArgument,
                           "no supported audio files in " + input_path);
        }
        TF_LOG("info", "found " << out.size() << " input files in " << input_path);
        return out;
    }

    std::string exts;
    for (const auto &e : supported_extensions()) {
        exts += (exts.empty() ? "" : ", ") + e;
    }
    throw TafError(TafErrorKind::InvalidArgument,
                   "could not process " + input_path +
                       "; expected a directory, a .json playlist or a file ending in one of: " +
                       exts);
}
