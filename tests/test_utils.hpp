// Minimal Ogg page walking and packet fixtures for tests only (page parsing kept
// independent of the library code to avoid self-consistency bugs).
#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace test_utils {

struct RawPage {
    uint8_t flags = 0;
    uint64_t granule = 0;
    uint32_t serial = 0;
    uint32_t seq = 0;
    std::vector<std::vector<uint8_t>> packets;  // complete packets only
    size_t size = 0;
};

// Walks back-to-back pages; stops at the first thing that is not a page.
inline std::vector<RawPage> walk_pages(const uint8_t *data, size_t size) {
    std::vector<RawPage> pages;
    size_t pos = 0;
    while (pos + 27 <= size && std::memcmp(data + pos, "OggS", 4) == 0) {
        const uint8_t *p = data + pos;
        RawPage page;
        page.flags = p[5];
        for (int i = 7; i >= 0; --i) {
            page.granule = (page.granule << 8) | p[6 + i];
        }
        page.serial = p[14] | (p[15] << 8) | (p[16] << 16) | (uint32_t(p[17]) << 24);
        page.seq = p[18] | (p[19] << 8) | (p[20] << 16) | (uint32_t(p[21]) << 24);
        const size_t segs = p[26];
        if (pos + 27 + segs > size) {
            break;
        }
        size_t body = 0;
        for (size_t i = 0; i < segs; ++i) {
            body += p[27 + i];
        }
        if (pos + 27 + segs + body > size) {
            break;
        }
        const uint8_t *payload = p + 27 + segs;
        std::vector<uint8_t> cur;
        for (size_t i = 0; i < segs; ++i) {
            cur.insert(cur.end(), payload, payload + p[27 + i]);
            payload += p[27 + i];
            if (p[27 + i] < 255) {
                page.packets.push_back(cur);
                cur.clear();
            }
        }
        page.size = 27 + segs + body;
        pages.push_back(page);
        pos += page.size;
    }
    return pages;
}

inline std::vector<RawPage> walk_pages(const std::vector<uint8_t> &bytes, size_t offset = 0) {
    return walk_pages(bytes.data() + offset, bytes.size() - offset);
}

// Payload whose first byte identifies the packet.
inline std::vector<uint8_t> tagged_payload(size_t index, size_t size, uint8_t first = 0) {
    std::vector<uint8_t> v(size);
    for (size_t i = 0; i < size; ++i) {
        v[i] = static_cast<uint8_t>((index * 7 + i) & 0xFF);
    }
    if (size > 0 && first != 0) {
        v[0] = first;
    }
    return v;
}

inline std::vector<uint8_t> opus_head(uint8_t channels = 2, uint32_t rate = 48000,
                                      uint8_t version = 1) {
    std::vector<uint8_t> h = {'O', 'p', 'u', 's', 'H', 'e', 'a', 'd', version, channels,
                              0x38, 0x01};  // pre-skip 312
    h.push_back(rate & 0xFF);
    h.push_back((rate >> 8) & 0xFF);
    h.push_back((rate >> 16) & 0xFF);
    h.push_back((rate >> 24) & 0xFF);
    h.push_back(0);  // gain
    h.push_back(0);
    h.push_back(0);  // mapping family
    return h;
}

inline std::vector<uint8_t> opus_tags(const std::string &vendor = "test") {
    std::vector<uint8_t> t = {'O', 'p', 'u', 's', 'T', 'a', 'g', 's'};
    const uint32_t n = static_cast<uint32_t>(vendor.size());
    t.push_back(n & 0xFF);
    t.push_back((n >> 8) & 0xFF);
    t.push_back((n >> 16) & 0xFF);
    t.push_back((n >> 24) & 0xFF);
    t.insert(t.end(), vendor.begin(), vendor.end());
    t.insert(t.end(), {0, 0, 0, 0});
    return t;
}

}  // namespace test_utils
