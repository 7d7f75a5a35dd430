#pragma once

#include <expected>
#include <format>
#include <string_view>


namespace pngchunk {

    enum class ChunkErrc {
        invalid_tag_bytes,   // a type tag byte is not an ASCII letter
        invalid_tag_string,  // a textual type tag is not exactly 4 bytes
        checksum_mismatch,
        non_utf8_payload,
        truncated_input,  // buffer ends before the declared chunk does
        length_overflow,  // declared length exceeds the configured maximum
    };

    const char* to_str(ChunkErrc errc);


    template <typename T>
    using ChunkExp = std::expected<T, ChunkErrc>;

}  // namespace pngchunk


template <>
struct std::formatter<pngchunk::ChunkErrc> : std::formatter<std::string_view> {
    template <typename TContext>
    auto format(pngchunk::ChunkErrc errc, TContext& ctx) const {
        return std::formatter<std::string_view>::format(
            pngchunk::to_str(errc), ctx
        );
    }
};
