// Opus header and TOC helpers.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "opus_packet.hpp"
#include "test_utils.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[opus_packet_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_opus_head() {
    const auto head = parse_opus_head(test_utils::opus_head());
    bool ok = check(head.has_value(), "OpusHead parses");
    if (!head) {
        return false;
    }
    ok &= check(head->version == 1 && head->channels == 2, "version and channels");
    ok &= check(head->pre_skip == 312 && head->input_sample_rate == 48000, "pre-skip and rate");
    ok &= check(head->output_gain == 0 && head->mapping_family == 0, "gain and mapping family");
    ok &= check(check_opus_head(*head).empty(), "stereo 48 kHz v1 accepted");

    ok &= check(!check_opus_head(*parse_opus_head(test_utils::opus_head(1))).empty(),
                "mono rejected");
    ok &= check(!check_opus_head(*parse_opus_head(test_utils::opus_head(2, 44100))).empty(),
                "44.1 kHz rejected");
    ok &= check(!check_opus_head(*parse_opus_head(test_utils::opus_head(2, 48000, 0))).empty(),
                "version 0 rejected");

    auto short_head = test_utils::opus_head();
    short_head.resize(18);
    ok &= check(!parse_opus_head(short_head), "truncated OpusHead");
    ok &= check(!parse_opus_head(test_utils::opus_tags()), "OpusTags is not an OpusHead");
    return ok;
}

bool test_opus_tags() {
    const auto tags = build_opus_tags("TafForge", {"TITLE=a.mp3"});
    std::vector<uint8_t> want = {'O', 'p', 'u', 's', 'T', 'a', 'g', 's', 8, 0, 0, 0};
    const std::string vendor = "TafForge";
    want.insert(want.end(), vendor.begin(), vendor.end());
    want.insert(want.end(), {1, 0, 0, 0, 11, 0, 0, 0});
    const std::string comment = "TITLE=a.mp3";
    want.insert(want.end(), comment.begin(), comment.end());
    bool ok = check(tags == want, "comment header layout");
    ok &= check(is_opus_tags(tags) && is_opus_tags(test_utils::opus_tags()), "is_opus_tags");
    ok &= check(!is_opus_tags(test_utils::opus_head()), "OpusHead is not OpusTags");
    ok &= check(build_opus_tags("", {}).size() == 16, "empty vendor and no comments");
    return ok;
}

bool test_frame_durations() {
    bool ok = check(opus_frame_samples(0) == 480 && opus_frame_samples(1) == 960 &&
                        opus_frame_samples(3) == 2880,
                    "SILK 10/20/60 ms");
    ok &= check(opus_frame_samples(12) == 480 && opus_frame_samples(13) == 960, "hybrid 10/20 ms");
    ok &= check(opus_frame_samples(16) == 120 && opus_frame_samples(18) == 480 &&
                    opus_frame_samples(31) == 960,
                "CELT 2.5/10/20 ms");
    ok &= check(!opus_config_is_celt(15) && opus_config_is_celt(16) && opus_config_is_celt(31),
                "CELT configuration range");
    ok &= check(opus_toc_config(0xF8) == 31 && opus_toc_config(0x08) == 1, "TOC config bits");
    return ok;
}

bool test_packet_samples() {
    const uint8_t one[] = {0xF8, 0x00};
    const uint8_t two_equal[] = {0xF9, 0x00};
    const uint8_t two_varied[] = {0xFA, 0x01, 0x00};
    const uint8_t three[] = {0xFB, 0x03, 0x00};
    const uint8_t no_count[] = {0xFB};

    bool ok = check(opus_packet_samples(one, sizeof(one)) == 960u, "code 0: one frame");
    ok &= check(opus_packet_samples(two_equal, sizeof(two_equal)) == 1920u, "code 1: two frames");
    ok &= check(opus_packet_samples(two_varied, sizeof(two_varied)) == 1920u,
                "code 2: two frames");
    ok &= check(opus_packet_samples(three, sizeof(three)) == 2880u, "code 3: counted frames");
    ok &= check(!opus_packet_samples(no_count, sizeof(no_count)), "code 3 without count byte");
    ok &= check(!opus_packet_samples(one, 0), "empty packet");
    return ok;
}

bool test_padding() {
    using Bytes = std::vector<uint8_t>;
    const Bytes code0 = {0xF8, 1, 2, 3};
    bool ok = check(opus_pad_packet(code0, 4) == code0, "target equal to the size is a no-op");
    ok &= check(opus_pad_packet(code0, 5) == Bytes({0xFB, 0x01, 1, 2, 3}),
                "one byte more gives the unpadded code-3 form");
    ok &= check(opus_pad_packet(code0, 6) == Bytes({0xFB, 0x41, 0x00, 1, 2, 3}),
                "a lone zero length byte adds one byte");
    ok &= check(opus_pad_packet(code0, 10) == Bytes({0xFB, 0x41, 0x04, 1, 2, 3, 0, 0, 0, 0}),
                "short padding");
    ok &= check(!opus_pad_packet(code0, 3), "packets are never shrunk below their frames");

    const auto big = opus_pad_packet(code0, 600);
    ok &= check(big && big->size() == 600, "long padding reaches the target");
    if (big && big->size() == 600) {
        ok &= check((*big)[2] == 255 && (*big)[3] == 255 && (*big)[4] == 84,
                    "length bytes: 255, 255, 84");
        ok &= check((*big)[5] == 1 && (*big)[6] == 2 && (*big)[7] == 3 && (*big)[8] == 0,
                    "frame data follows the length bytes");
        ok &= check(opus_packet_samples(big->data(), big->size()) == 960u,
                    "padding keeps the frame count");
        ok &= check(opus_pad_packet(*big, 10) == opus_pad_packet(code0, 10),
                    "existing padding is replaced");
    }

    ok &= check(opus_pad_packet({0xF9, 7, 7, 8, 8}, 6) == Bytes({0xFB, 0x02, 7, 7, 8, 8}),
                "code 1 becomes a two-frame CBR code-3 packet");
    ok &= check(opus_pad_packet({0xFA, 1, 7, 8, 8}, 6) == Bytes({0xFB, 0x82, 1, 7, 8, 8}),
                "code 2 becomes a two-frame VBR code-3 packet");

    ok &= check(!opus_pad_packet({}, 50), "empty packet");
    ok &= check(!opus_pad_packet({0xFA}, 50), "code 2 without frame length");
    ok &= check(!opus_pad_packet({0xFB}, 50), "code 3 without frame count");
    ok &= check(!opus_pad_packet({0xFB, 0x00, 1}, 50), "code 3 with zero frames");
    ok &= check(!opus_pad_packet({0xFB, 0x41, 0xFF}, 50), "padding length runs off the end");
    ok &= check(!opus_pad_packet({0xFB, 0x41, 0x10, 1}, 50), "padding longer than the packet");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_opus_head();
    ok &= test_opus_tags();
    ok &= test_frame_durations();
    ok &= test_packet_samples();
    ok &= test_padding();
    return ok ? 0 : 1;
}
