#pragma once

#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

#include "pngchunk/chunk/chunk_error.hpp"


namespace pngchunk {

    // Standard chunk types defined by the PNG specification
    namespace tag_names {

        // Critical
        constexpr std::string_view IHDR = "IHDR";
        constexpr std::string_view PLTE = "PLTE";
        constexpr std::string_view IDAT = "IDAT";
        constexpr std::string_view IEND = "IEND";

        // Ancillary
        constexpr std::string_view bKGD = "bKGD";
        constexpr std::string_view cHRM = "cHRM";
        constexpr std::string_view gAMA = "gAMA";
        constexpr std::string_view hIST = "hIST";
        constexpr std::string_view iCCP = "iCCP";
        constexpr std::string_view iTXt = "iTXt";
        constexpr std::string_view pHYs = "pHYs";
        constexpr std::string_view sBIT = "sBIT";
        constexpr std::string_view sPLT = "sPLT";
        constexpr std::string_view sRGB = "sRGB";
        constexpr std::string_view tEXt = "tEXt";
        constexpr std::string_view tIME = "tIME";
        constexpr std::string_view tRNS = "tRNS";
        constexpr std::string_view zTXt = "zTXt";

    }  // namespace tag_names


    /**
     * Four byte chunk type name.
     *
     * Every byte is an ASCII letter. Bit 5 of each byte (its letter case)
     * carries one property flag, see the PNG spec section 5.4.
     */
    class TypeTag {

    public:
        using Bytes = std::array<uint8_t, 4>;

    public:
        static ChunkExp<TypeTag> from_bytes(const Bytes& bytes);
        static ChunkExp<TypeTag> from_str(std::string_view str);

        const Bytes& bytes() const { return bytes_; }

        // Only the reserved bit is checked, letters are checked on creation
        bool is_valid() const;

        bool is_critical() const;
        bool is_public() const;
        bool is_reserved_bit_valid() const;
        bool is_safe_to_copy() const;

        // One of the chunk types listed in tag_names
        bool is_standard() const;

        std::string to_str() const;

        bool operator==(const TypeTag& rhs) const = default;

    private:
        explicit TypeTag(const Bytes& bytes) : bytes_(bytes) {}

        Bytes bytes_;
    };

}  // namespace pngchunk


template <>
struct std::formatter<pngchunk::TypeTag> : std::formatter<std::string_view> {
    template <typename TContext>
    auto format(const pngchunk::TypeTag& tag, TContext& ctx) const {
        return std::formatter<std::string_view>::format(tag.to_str(), ctx);
    }
};
