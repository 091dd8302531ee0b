#include "storage/record.hpp"
#include "storage/errors.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace caskdb::storage {

namespace {

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value >> 16));
    out.push_back(static_cast<std::uint8_t>(value >> 24));
}

std::uint32_t get_u32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

} // namespace

EncodedRecord encode_record(std::uint32_t timestamp, std::string_view key, std::string_view value) {
    if (key.size() > MAX_FIELD_SIZE) {
        throw std::invalid_argument(fmt::format("Key too large: {} bytes", key.size()));
    }
    if (value.size() > MAX_FIELD_SIZE) {
        throw std::invalid_argument(fmt::format("Value too large: {} bytes", value.size()));
    }

    EncodedRecord encoded;
    encoded.size = HEADER_SIZE + key.size() + value.size();
    encoded.bytes.reserve(encoded.size);

    put_u32(encoded.bytes, timestamp);
    put_u32(encoded.bytes, static_cast<std::uint32_t>(key.size()));
    put_u32(encoded.bytes, static_cast<std::uint32_t>(value.size()));
    encoded.bytes.insert(encoded.bytes.end(), key.begin(), key.end());
    encoded.bytes.insert(encoded.bytes.end(), value.begin(), value.end());

    return encoded;
}

RecordHeader decode_header(const std::uint8_t* data, std::size_t size) {
    if (size < HEADER_SIZE) {
        throw MalformedHeader(fmt::format("Header needs {} bytes, got {}", HEADER_SIZE, size));
    }

    RecordHeader header;
    header.timestamp = get_u32(data);
    header.key_size = get_u32(data + 4);
    header.value_size = get_u32(data + 8);
    return header;
}

RecordHeader decode_header(const std::vector<std::uint8_t>& bytes) {
    return decode_header(bytes.data(), bytes.size());
}

Record decode_record(const std::uint8_t* data, std::size_t size, bool validate_utf8) {
    RecordHeader header;
    try {
        header = decode_header(data, size);
    } catch (const MalformedHeader& e) {
        throw MalformedRecord(e.what());
    }

    if (size < header.record_size()) {
        throw MalformedRecord(fmt::format("Record needs {} bytes, got {}", header.record_size(), size));
    }

    const char* payload = reinterpret_cast<const char*>(data + HEADER_SIZE);

    Record record;
    record.timestamp = header.timestamp;
    record.key.assign(payload, header.key_size);
    record.value.assign(payload + header.key_size, header.value_size);

    if (validate_utf8) {
        if (!is_valid_utf8(record.key)) {
            throw MalformedRecord("Record key is not valid UTF-8");
        }
        if (!is_valid_utf8(record.value)) {
            throw MalformedRecord("Record value is not valid UTF-8");
        }
    }

    return record;
}

Record decode_record(const std::vector<std::uint8_t>& bytes, bool validate_utf8) {
    return decode_record(bytes.data(), bytes.size(), validate_utf8);
}

bool is_valid_utf8(std::string_view text) {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();

    while (p < end) {
        unsigned char lead = *p;
        if (lead < 0x80) {
            ++p;
            continue;
        }

        std::size_t length;
        std::uint32_t code_point;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (static_cast<std::size_t>(end - p) < length) {
            return false;
        }

        for (std::size_t i = 1; i < length; ++i) {
            if ((p[i] & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (p[i] & 0x3F);
        }

        // Overlong encodings, UTF-16 surrogates and out-of-range code points
        if ((length == 2 && code_point < 0x80) ||
            (length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        p += length;
    }

    return true;
}

} // namespace caskdb::storage
