//
//  tafforge.hpp
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

#include "page_muxer.hpp"
#include "taf_error.hpp"
#include "taf_header.hpp"
#include "taf_writer.hpp"
#include "transcoder.hpp"

namespace tafforge {

/// @defgroup api TafForge Public API
/// Public, supported C++ interfaces for writing, checking and unpacking TAF files.
/// @{

/**
 * @brief Result object with success flag, error kind and optional error message.
 *
 * When `ok == true`, `error` is `TafErrorKind::None` and `message` is empty. On failure,
 * `error` names the failure class and `message` says what went wrong.
 */
struct TafStatus {
    bool ok{false};
    TafErrorKind error{TafErrorKind::None};
    std::string message;
};

inline constexpr const char *kDefaultOutputName = "500304E0";

/**
 * @brief Conversion settings, passed explicitly into every conversion.
 */
struct ConvertOptions {
    std::string ffmpeg_path = "ffmpeg";
    std::string default_output_name = kDefaultOutputName;
    std::optional<uint32_t> timestamp;  ///< audio id; current unix time when unset
    uint32_t bitrate_kbps = kDefaultBitrateKbps;
    bool vbr = true;
    WriteDiscipline discipline = WriteDiscipline::SeekPatch;
    size_t max_page_size = kDefaultMaxPageSize;
    bool celt_only = true;
};

struct ConvertResult {
    TafStatus status;
    std::string output_path;
    TafHeader header;
    uint32_t page_count = 0;
    size_t track_count = 0;
    uint64_t total_granule = 0;
};

struct ExtractResult {
    TafStatus status;
    std::vector<std::string> written;  ///< output files, in chapter order
};

struct TafInfo {
    uint32_t audio_id = 0;
    std::string sha1_hash;      ///< embedded, lowercase hex
    std::string computed_hash;  ///< over the audio region, lowercase hex
    bool hash_ok = false;
    uint32_t num_bytes = 0;
    uint32_t header_length = 0;
    size_t fill_bytes = 0;
    std::vector<uint32_t> chapter_pages;
    uint32_t page_count = 0;
    uint32_t damaged_regions = 0;  ///< runs of bytes skipped while scanning pages (bad CRC)
    uint64_t total_granule = 0;
    double duration_seconds = 0.0;
};

struct InfoResult {
    TafStatus status;
    TafInfo info;  ///< filled as far as the file could be read
};

/**
 * @brief Return the TafForge library version string (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Parse a decimal or `0x`-prefixed hex audio id. std::nullopt when invalid or > 32 bits.
std::optional<uint32_t> parse_timestamp(const std::string &text);  ///< @ingroup api

/// Place `default_output_name` inside `output` when it names an existing directory;
/// use the default name alone when `output` is empty.
std::string resolve_output_path(const std::string &output,
                                const ConvertOptions &options);  ///< @ingroup api

/**
 * @brief Convert a file, directory or JSON playlist into one TAF file.
 *
 * Every input becomes one chapter. Non-Opus inputs are transcoded with ffmpeg. The file is
 * written to `<output>.part` and renamed on success; the partial file is removed on failure.
 *
 * @param input_path Audio file, directory of audio files, or `.json` playlist.
 * @param output_path Destination file or existing directory; empty for the default name.
 * @param options Conversion settings.
 */
ConvertResult convert_to_taf(const std::string &input_path, const std::string &output_path,
                             const ConvertOptions &options = {});  ///< @ingroup api

/// @overload explicit input list and transcoding backend (ffmpeg_path/bitrate/vbr unused).
ConvertResult convert_to_taf(const std::vector<std::string> &inputs,
                             const std::string &output_path, Transcoder &transcoder,
                             const ConvertOptions &options = {});  ///< @ingroup api

/**
 * @brief Unpack a TAF file into standalone Ogg Opus files.
 *
 * A single-chapter file becomes `<stem>.ogg`; otherwise each chapter becomes
 * `NN_<stem>.ogg` (1-based). The hash is verified before anything is written.
 *
 * @param input_file TAF file.
 * @param output_dir Target directory (created when missing); empty for the current one.
 * @param chapter Optional 0-based chapter to write alone.
 */
ExtractResult extract_taf(const std::string &input_file, const std::string &output_dir,
                          std::optional<size_t> chapter = std::nullopt);  ///< @ingroup api

/// Inspect a TAF file without trusting its hash; status reflects overall validity.
InfoResult read_taf_info(const std::string &input_file);  ///< @ingroup api

/// @}

}  // namespace tafforge

#ifdef TAFFORGE_TESTING
// Test-only wrapper for the per-chapter output naming used by extract_taf().
std::string chapter_file_name_for_test(const std::string &stem, size_t chapter, size_t count);
#endif
