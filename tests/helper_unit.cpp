// Unit coverage for small helpers: byte readers/writers, hex preview, SHA-1 and
// log level parsing.
#include <array>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "byte_io.hpp"
#include "logging.hpp"
#include "sha1_accumulator.hpp"
#include "taf_error.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_endian_helpers() {
    std::vector<uint8_t> buf;
    write_u32_be(buf, 0x01020304u);
    bool ok = check(buf == std::vector<uint8_t>({1, 2, 3, 4}), "write_u32_be byte order");
    ok &= check(read_u32_be(buf.data()) == 0x01020304u, "read_u32_be decode");

    buf.clear();
    write_u16_le(buf, 0xBEEF);
    write_u32_le(buf, 0x01020304u);
    write_u64_le(buf, 0x0102030405060708ULL);
    ok &= check(buf.size() == 14, "little-endian writers emit 2+4+8 bytes");
    ok &= check(buf[0] == 0xEF && buf[1] == 0xBE, "write_u16_le byte order");
    ok &= check(read_u16_le(buf.data()) == 0xBEEF, "read_u16_le decode");
    ok &= check(read_u32_le(buf.data() + 2) == 0x01020304u, "read_u32_le decode");
    ok &= check(buf[6] == 0x08 && buf[13] == 0x01, "write_u64_le byte order");
    ok &= check(read_u64_le(buf.data() + 6) == 0x0102030405060708ULL, "read_u64_le decode");
    return ok;
}

bool test_hex_prefix() {
    using tafforge::hex_prefix;
    bool ok = check(hex_prefix(nullptr, 0) == "", "hex_prefix empty");
    std::vector<uint8_t> data = {0x00, 0x11, 0xAB, 0xCD, 0xFF};
    ok &= check(hex_prefix(data.data(), data.size(), 4) == "00 11 ab cd",
                "hex_prefix truncates to max_len");
    ok &= check(hex_prefix(data.data(), data.size()) == "00 11 ab cd ff",
                "hex_prefix default prints all up to limit");
    std::array<uint8_t, 3> arr = {0x0A, 0xB0, 0x01};
    ok &= check(tafforge::hex_string(arr) == "0ab001", "hex_string has no separators");
    return ok;
}

bool test_sha1() {
    const std::string abc = "abc";
    const auto d = sha1_digest(reinterpret_cast<const uint8_t *>(abc.data()), abc.size());
    bool ok = check(tafforge::hex_string(d) == "a9993e364706816aba3e25717850c26c9cd0d89d",
                    "sha1(\"abc\") matches the FIPS 180 vector");

    const auto empty = sha1_digest(nullptr, 0);
    ok &= check(tafforge::hex_string(empty) == "da39a3ee5e6b4b0d3255bfef95601890afd80709",
                "sha1 of empty input");

    Sha1Accumulator acc;
    acc.update(reinterpret_cast<const uint8_t *>("a"), 1);
    acc.update(std::vector<uint8_t>{'b', 'c'});
    ok &= check(acc.bytes_hashed() == 3, "accumulator counts hashed bytes");
    ok &= check(acc.finalize() == d, "incremental updates match one-shot digest");

    bool threw = false;
    try {
        acc.finalize();
    } catch (const TafError &e) {
        threw = e.kind() == TafErrorKind::EncodeError;
    }
    ok &= check(threw, "second finalize is rejected");
    return ok;
}

bool test_log_levels() {
    using tafforge::LogVerbosity;
    using tafforge::parse_log_verbosity;
    bool ok = check(parse_log_verbosity("debug") == LogVerbosity::Debug, "parse debug");
    ok &= check(parse_log_verbosity("warning") == LogVerbosity::Warn, "parse warning alias");
    ok &= check(parse_log_verbosity("bogus") == LogVerbosity::Error, "unknown maps to error");

    const auto saved = tafforge::get_log_verbosity();
    tafforge::set_log_verbosity(LogVerbosity::Warn);
    ok &= check(tf_should_log("error") && tf_should_log("warn"), "warn level lets warnings out");
    ok &= check(!tf_should_log("info") && !tf_should_log("muxer"),
                "warn level suppresses info and tagged debug output");
    tafforge::set_log_verbosity(saved);
    ok &= check(std::string(taf_error_kind_name(TafErrorKind::HashMismatch)) == "HashMismatch",
                "error kind names");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_endian_helpers();
    ok &= test_hex_prefix();
    ok &= test_sha1();
    ok &= test_log_levels();
    return ok ? 0 : 1;
}
