#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace caskdb::storage {

/**
 * On-disk record layout
 *
 * [4 bytes: timestamp] [4 bytes: key_length] [4 bytes: value_length]
 * [key_length bytes: key] [value_length bytes: value]
 *
 * All header fields are unsigned 32-bit little-endian. There is no padding,
 * terminator, magic number or checksum.
 */
constexpr std::size_t HEADER_SIZE = 12;
constexpr std::uint64_t MAX_FIELD_SIZE = UINT32_MAX;

struct RecordHeader {
    std::uint32_t timestamp{0};
    std::uint32_t key_size{0};
    std::uint32_t value_size{0};

    std::uint64_t record_size() const {
        return HEADER_SIZE + static_cast<std::uint64_t>(key_size) + value_size;
    }
};

struct Record {
    std::uint32_t timestamp{0};
    std::string key;
    std::string value;
};

struct EncodedRecord {
    std::uint64_t size{0};
    std::vector<std::uint8_t> bytes;
};

// Throws std::invalid_argument if key or value does not fit a length field
EncodedRecord encode_record(std::uint32_t timestamp, std::string_view key, std::string_view value);

// Throws MalformedHeader if fewer than HEADER_SIZE bytes are supplied
RecordHeader decode_header(const std::uint8_t* data, std::size_t size);
RecordHeader decode_header(const std::vector<std::uint8_t>& bytes);

/**
 * Parse a header-prefixed record. Throws MalformedRecord if the buffer is
 * shorter than the header claims, or if validate_utf8 is set and the key or
 * value is not well-formed UTF-8. Bytes past the record are ignored.
 */
Record decode_record(const std::uint8_t* data, std::size_t size, bool validate_utf8 = true);
Record decode_record(const std::vector<std::uint8_t>& bytes, bool validate_utf8 = true);

bool is_valid_utf8(std::string_view text);

} // namespace caskdb::storage
