//
//  taf_writer.cpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "taf_writer.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "logging.hpp"
#include "sha1_accumulator.hpp"
#include "taf_error.hpp"

namespace {

void write_all(std::ostream &out, const std::vector<uint8_t> &bytes, const char *what) {
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out.good()) {
        throw TafError(TafErrorKind::IoError, std::string("sink write failed (") + what + ")");
    }
}

// Two-pass: pages are kept in memory until the header is known.
class SpoolStrategy : public HeaderWriteStrategy {
   public:
    explicit SpoolStrategy(std::ostream &out) : out_(out) {}

    void begin() override { spool_.clear(); }

    void write_page(const std::vector<uint8_t> &bytes) override {
        spool_.insert(spool_.end(), bytes.begin(), bytes.end());
    }

    void finish(const std::vector<uint8_t> &header_block) override {
        write_all(out_, header_block, "header block");
        write_all(out_, spool_, "spooled pages");
        out_.flush();
        if (!out_.good()) {
            throw TafError(TafErrorKind::IoError, "sink flush failed");
        }
        TF_LOG("debug", "spool: wrote " << header_block.size() << " + " << spool_.size()
                                        << " bytes");
        spool_.clear();
    }

   private:
    std::ostream &out_;
    std::vector<uint8_t> spool_;
};

// Placeholder-then-patch: pages stream straight to the sink.
class SeekPatchStrategy : public HeaderWriteStrategy {
   public:
    explicit SeekPatchStrategy(std::ostream &out) : out_(out) {}

    void begin() override {
        start_ = out_.tellp();
        if (start_ == std::streampos(-1)) {
            throw TafError(TafErrorKind::IoError, "seek-patch discipline needs a seekable sink");
        }
        write_all(out_, std::vector<uint8_t>(kTafHeaderBlockSize, 0), "header placeholder");
    }

    void write_page(const std::vector<uint8_t> &bytes) override {
        write_all(out_, bytes, "page");
    }

    void finish(const std::vector<uint8_t> &header_block) override {
        const std::streampos end = out_.tellp();
        out_.seekp(start_);
        if (!out_.good()) {
            throw TafError(TafErrorKind::IoError, "seek to header block failed");
        }
        write_all(out_, header_block, "header patch");
        out_.seekp(end);
        out_.flush();
        if (!out_.good()) {
            throw TafError(TafErrorKind::IoError, "sink flush failed");
        }
        TF_LOG("debug", "seek-patch: patched header at offset " << std::streamoff(start_));
    }

   private:
    std::ostream &out_;
    std::streampos start_{-1};
};

}  // namespace

const char *write_discipline_name(WriteDiscipline discipline) {
    switch (discipline) {
        case WriteDiscipline::Spool:
            return "spool";
        case WriteDiscipline::SeekPatch:
            return "seek-patch";
    }
    return "unknown";
}

std::unique_ptr<HeaderWriteStrategy> make_write_strategy(WriteDiscipline discipline,
                                                         std::ostream &out) {
    if (discipline == WriteDiscipline::SeekPatch) {
        return std::make_unique<SeekPatchStrategy>(out);
    }
    return std::make_unique<SpoolStrategy>(out);
}

TafWriteResult TafWriter::write(PacketSource &source, PageMuxerConfig config,
                                uint32_t audio_id) {
    const auto t0 = std::chrono::steady_clock::now();
    config.serial_no = audio_id;
    auto strategy = make_write_strategy(discipline_, out_);
    strategy->begin();

    std::unique_ptr<PageMuxer> muxer;
    Sha1Accumulator sha;
    uint64_t region = 0;
    try {
        muxer = std::make_unique<PageMuxer>(source, std::move(config));
        while (auto page = muxer->next_page()) {
            const auto bytes = page->serialize();
            sha.update(bytes);
            region += bytes.size();
            strategy->write_page(bytes);
        }
    } catch (const TafError &e) {
        if (e.kind() != TafErrorKind::InvalidArgument) {
            throw;
        }
        throw TafError(TafErrorKind::EncodeError, std::string("muxer configuration: ") + e.what());
    } catch (const std::exception &e) {
        throw TafError(TafErrorKind::EncodeError, std::string("packet source failed: ") + e.what());
    }
    if (region > 0xFFFFFFFFull) {
        throw TafError(TafErrorKind::EncodeError,
                       "audio region of " + std::to_string(region) +
                           " bytes does not fit the 32-bit length field");
    }

    TafWriteResult result;
    result.header.audio_id = audio_id;
    result.header.sha1_hash = sha.finalize();
    result.header.num_bytes = static_cast<uint32_t>(region);
    result.header.track_page_nums = muxer->chapter_marks();
    result.page_count = muxer->page_count();
    result.packet_count = muxer->packet_count();
    result.total_granule = muxer->total_granule();

    std::vector<uint8_t> block;
    try {
        block = build_taf_header_block(result.header);
    } catch (const TafError &e) {
        if (e.kind() != TafErrorKind::HeaderOverflow) {
            throw;
        }
        throw TafError(TafErrorKind::EncodeError, std::string("header overflow: ") + e.what());
    }
    strategy->finish(block);
    result.bytes_written = kTafHeaderBlockSize + region;

    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0)
            .count();
    TF_LOG("info", "wrote TAF: " << result.page_count << " pages, " << result.packet_count
                                 << " packets, " << result.header.track_page_nums.size()
                                 << " chapters, " << region << " audio bytes ("
                                 << write_discipline_name(discipline_) << ", " << ms << " ms)");
    TF_LOG("debug", "sha1=" << tafforge::hex_prefix(result.header.sha1_hash.data(),
                                                    result.header.sha1_hash.size(), 20));
    return result;
}

TafWriteResult TafWriter::write(std::vector<AudioPacket> packets, std::set<size_t> boundaries,
                                PageMuxerConfig config, uint32_t audio_id) {
    VectorPacketSource source(std::move(packets), std::move(boundaries));
    return write(source, std::move(config), audio_id);
}
