//
//  extractor.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "extractor.hpp"

#include <limits>
#include <string>
#include <utility>

#include "logging.hpp"
#include "taf_error.hpp"

namespace {

// Granule value of a page on which no packet completes.
constexpr uint64_t kNoGranule = std::numeric_limits<uint64_t>::max();

struct ExtractPlan {
    uint32_t first = 0;
    uint32_t end = std::numeric_limits<uint32_t>::max();  // exclusive
    bool with_stream_headers = false;
};

void emit(std::vector<uint8_t> &out, OggPage page, uint32_t seq, uint64_t base,
          bool first, bool last) {
    page.page_no = seq;
    page.header_type &= static_cast<uint8_t>(~(kOggFlagBos | kOggFlagEos));
    if (first) {
        page.header_type |= kOggFlagBos;
    }
    if (last) {
        page.header_type |= kOggFlagEos;
    }
    if (page.granule_position != kNoGranule && page.granule_position >= base) {
        page.granule_position -= base;
    }
    const auto bytes = page.serialize();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // namespace

size_t chapter_count(const TafHandle &handle) { return handle.chapter_pages().size(); }

std::vector<uint8_t> extract_audio(const TafHandle &handle, std::optional<size_t> chapter) {
    const auto &marks = handle.chapter_pages();
    ExtractPlan plan;
    if (chapter) {
        if (*chapter >= marks.size()) {
            throw TafError(TafErrorKind::InvalidArgument,
                           "chapter " + std::to_string(*chapter + 1) + " requested, file has " +
                               std::to_string(marks.size()));
        }
        plan.first = marks[*chapter];
        if (*chapter + 1 < marks.size()) {
            plan.end = marks[*chapter + 1];
        }
        plan.with_stream_headers = *chapter > 0;
    }

    // Single forward pass: stream header pages (leading granule-0 run) are kept aside in
    // case the selected range starts later; the range itself is collected as-is.
    std::vector<OggPage> stream_headers;
    std::vector<OggPage> selected;
    bool in_header_run = true;
    uint64_t base = 0;
    uint32_t ordinal = 0;
    auto cursor = handle.pages();
    while (auto page = cursor.next()) {
        if (in_header_run) {
            if (page->granule_position == 0 && !page->eos()) {
                if (ordinal < plan.first) {
                    stream_headers.push_back(*page);
                }
            } else {
                in_header_run = false;
            }
        }
        if (ordinal < plan.first) {
            if (page->granule_position != kNoGranule) {
                base = page->granule_position;
            }
        } else if (ordinal < plan.end) {
            selected.emplace_back(std::move(*page));
        } else {
            break;
        }
        ++ordinal;
    }

    if (selected.empty()) {
        throw TafError(TafErrorKind::MalformedHeader,
                       "chapter starting at page " + std::to_string(plan.first) +
                           " lies past the last page (" + std::to_string(ordinal) + " pages)");
    }

    std::vector<uint8_t> out;
    uint32_t seq = 0;
    const size_t total = (plan.with_stream_headers ? stream_headers.size() : 0) + selected.size();
    if (plan.with_stream_headers) {
        for (auto &page : stream_headers) {
            emit(out, std::move(page), seq, 0, seq == 0, seq + 1 == total);
            ++seq;
        }
    }
    for (auto &page : selected) {
        emit(out, std::move(page), seq, base, seq == 0, seq + 1 == total);
        ++seq;
    }
    TF_LOG("debug", "extract: " << seq << " pages, " << out.size() << " bytes, granule base "
                                << base);
    return out;
}
