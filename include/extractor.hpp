//
//  extractor.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "taf_reader.hpp"

size_t chapter_count(const TafHandle &handle);

// Re-emit the audio region as a standalone Ogg stream. Pages are renumbered from 0,
// granules rebased to the extraction start, BOS/EOS set on the first/last page and CRCs
// recomputed. With a (0-based) chapter, only pages [mark_k, mark_k+1) are emitted, preceded
// by the stream header pages when k > 0. Throws TafError(InvalidArgument) for an unknown
// chapter and TafError(MalformedHeader) for unparseable pages.
std::vector<uint8_t> extract_audio(const TafHandle &handle,
                                   std::optional<size_t> chapter = std::nullopt);
