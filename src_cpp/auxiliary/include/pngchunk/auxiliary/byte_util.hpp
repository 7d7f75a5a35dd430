#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>


namespace pngchunk {

    // Network byte order, as every integer in a PNG stream is stored
    uint32_t read_u32_be(const uint8_t* src);
    void append_u32_be(std::vector<uint8_t>& dst, uint32_t value);

    /**
     * Strict UTF-8 check. Rejects overlong forms, UTF-16 surrogates and
     * code points above U+10FFFF.
     */
    bool is_valid_utf8(const uint8_t* data, size_t size);

}  // namespace pngchunk
