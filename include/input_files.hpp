//
//  input_files.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <string>
#include <vector>

// Lowercase extensions (without dot) accepted as conversion inputs.
const std::vector<std::string> &supported_extensions();

bool is_supported_audio_file(const std::string &path);

// "Human" ordering: digit runs compare by value, letters case-insensitively,
// so "track2" sorts before "track10".
bool natural_less(const std::string &a, const std::string &b);

// Resolve a conversion input: a single supported file, a directory (its supported files in
// natural order, non-recursive) or a .json playlist ({"tracks": [...]}, relative paths
// resolved against the playlist's directory). Throws TafError(InvalidArgument) when nothing
// usable is found, TafError(IoError) for an unreadable or malformed playlist.
std::vector<std::string> filter_input_files(const std::string &input_path);

std::vector<std::string> load_playlist(const std::string &json_path);
