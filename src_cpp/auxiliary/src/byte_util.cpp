#include "pngchunk/auxiliary/byte_util.hpp"


namespace {

    bool is_continuation(uint8_t b) { return (b & 0xC0) == 0x80; }

    // Returns the byte length of the sequence starting at data[0], or 0
    size_t utf8_seq_size(const uint8_t* data, size_t remaining) {
        const uint8_t lead = data[0];

        if (lead < 0x80)
            return 1;

        if (lead >= 0xC2 && lead <= 0xDF) {
            if (remaining < 2 || !is_continuation(data[1]))
                return 0;
            return 2;
        }

        if (lead >= 0xE0 && lead <= 0xEF) {
            if (remaining < 3)
                return 0;
            const uint8_t b1 = data[1];
            // E0 must not be overlong, ED must not encode surrogates
            if (lead == 0xE0 && (b1 < 0xA0 || b1 > 0xBF))
                return 0;
            if (lead == 0xED && (b1 < 0x80 || b1 > 0x9F))
                return 0;
            if (!is_continuation(b1) || !is_continuation(data[2]))
                return 0;
            return 3;
        }

        if (lead >= 0xF0 && lead <= 0xF4) {
            if (remaining < 4)
                return 0;
            const uint8_t b1 = data[1];
            if (lead == 0xF0 && (b1 < 0x90 || b1 > 0xBF))
                return 0;
            if (lead == 0xF4 && (b1 < 0x80 || b1 > 0x8F))
                return 0;
            if (!is_continuation(b1) || !is_continuation(data[2]) ||
                !is_continuation(data[3]))
                return 0;
            return 4;
        }

        return 0;
    }

}  // namespace


namespace pngchunk {

    uint32_t read_u32_be(const uint8_t* src) {
        return (static_cast<uint32_t>(src[0]) << 24) |
               (static_cast<uint32_t>(src[1]) << 16) |
               (static_cast<uint32_t>(src[2]) << 8) |
               static_cast<uint32_t>(src[3]);
    }

    void append_u32_be(std::vector<uint8_t>& dst, uint32_t value) {
        dst.push_back(static_cast<uint8_t>(value >> 24));
        dst.push_back(static_cast<uint8_t>(value >> 16));
        dst.push_back(static_cast<uint8_t>(value >> 8));
        dst.push_back(static_cast<uint8_t>(value));
    }

    bool is_valid_utf8(const uint8_t* data, size_t size) {
        size_t pos = 0;
        while (pos < size) {
            const auto seq_size = ::utf8_seq_size(data + pos, size - pos);
            if (seq_size == 0)
                return false;
            pos += seq_size;
        }
        return true;
    }

}  // namespace pngchunk
