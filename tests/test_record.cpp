#include <catch2/catch.hpp>
#include "storage/record.hpp"
#include "storage/errors.hpp"
#include <string>
#include <vector>

using namespace caskdb::storage;

TEST_CASE("Record encoding layout", "[record]") {
    auto encoded = encode_record(0x01020304, "ab", "xyz");

    REQUIRE(encoded.size == HEADER_SIZE + 2 + 3);
    REQUIRE(encoded.bytes.size() == encoded.size);

    SECTION("Header fields are little-endian u32") {
        std::vector<std::uint8_t> expected_header = {
            0x04, 0x03, 0x02, 0x01,  // timestamp
            0x02, 0x00, 0x00, 0x00,  // key length
            0x03, 0x00, 0x00, 0x00   // value length
        };
        REQUIRE(std::vector<std::uint8_t>(encoded.bytes.begin(),
                                          encoded.bytes.begin() + HEADER_SIZE) == expected_header);
    }

    SECTION("Key and value follow the header without padding") {
        std::string payload(encoded.bytes.begin() + HEADER_SIZE, encoded.bytes.end());
        REQUIRE(payload == "abxyz");
    }
}

TEST_CASE("Record decoding", "[record]") {
    SECTION("Round trip") {
        auto encoded = encode_record(1700000000, "othello", "shakespeare");
        auto record = decode_record(encoded.bytes);

        REQUIRE(record.timestamp == 1700000000);
        REQUIRE(record.key == "othello");
        REQUIRE(record.value == "shakespeare");
    }

    SECTION("Empty key and value") {
        auto encoded = encode_record(7, "", "");
        REQUIRE(encoded.size == HEADER_SIZE);

        auto record = decode_record(encoded.bytes);
        REQUIRE(record.timestamp == 7);
        REQUIRE(record.key.empty());
        REQUIRE(record.value.empty());
    }

    SECTION("Multi-byte UTF-8 text") {
        auto encoded = encode_record(1, "ключ", "値 ✓ 🚀");
        auto record = decode_record(encoded.bytes);
        REQUIRE(record.key == "ключ");
        REQUIRE(record.value == "値 ✓ 🚀");
    }

    SECTION("Header only decode ignores payload") {
        auto encoded = encode_record(42, "key", "value");
        auto header = decode_header(encoded.bytes.data(), HEADER_SIZE);

        REQUIRE(header.timestamp == 42);
        REQUIRE(header.key_size == 3);
        REQUIRE(header.value_size == 5);
        REQUIRE(header.record_size() == encoded.size);
    }

    SECTION("Trailing bytes after the record are ignored") {
        auto encoded = encode_record(1, "k", "v");
        encoded.bytes.push_back('!');

        auto record = decode_record(encoded.bytes);
        REQUIRE(record.value == "v");
    }
}

TEST_CASE("Record decoding failures", "[record]") {
    auto encoded = encode_record(1, "key", "value");

    SECTION("Short header") {
        REQUIRE_THROWS_AS(decode_header(encoded.bytes.data(), HEADER_SIZE - 1), MalformedHeader);
        REQUIRE_THROWS_AS(decode_header(std::vector<std::uint8_t>{}), MalformedHeader);
    }

    SECTION("Record shorter than its header claims") {
        std::vector<std::uint8_t> truncated(encoded.bytes.begin(), encoded.bytes.end() - 1);
        REQUIRE_THROWS_AS(decode_record(truncated), MalformedRecord);
    }

    SECTION("Record shorter than a header") {
        std::vector<std::uint8_t> truncated(encoded.bytes.begin(), encoded.bytes.begin() + 4);
        REQUIRE_THROWS_AS(decode_record(truncated), MalformedRecord);
    }

    SECTION("Invalid UTF-8 value") {
        auto bad = encode_record(1, "key", std::string("\xC3\x28", 2));
        REQUIRE_THROWS_AS(decode_record(bad.bytes), MalformedRecord);

        // Accepted when text validation is off
        auto record = decode_record(bad.bytes, false);
        REQUIRE(record.value == std::string("\xC3\x28", 2));
    }
}

TEST_CASE("UTF-8 validation", "[record]") {
    REQUIRE(is_valid_utf8(""));
    REQUIRE(is_valid_utf8("plain ascii"));
    REQUIRE(is_valid_utf8("caf\xC3\xA9"));
    REQUIRE(is_valid_utf8("\xF0\x9F\x9A\x80"));

    REQUIRE_FALSE(is_valid_utf8("\x80"));                  // Stray continuation byte
    REQUIRE_FALSE(is_valid_utf8("\xC3"));                  // Truncated sequence
    REQUIRE_FALSE(is_valid_utf8("\xC0\xAF"));              // Overlong '/'
    REQUIRE_FALSE(is_valid_utf8("\xED\xA0\x80"));          // UTF-16 surrogate
    REQUIRE_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));      // Above U+10FFFF
    REQUIRE_FALSE(is_valid_utf8("\xFF"));
}
