#include "pngchunk/chunk/type_tag.hpp"

#include <algorithm>


namespace {

    constexpr std::array STANDARD_TAGS = {
        pngchunk::tag_names::IHDR, pngchunk::tag_names::PLTE,
        pngchunk::tag_names::IDAT, pngchunk::tag_names::IEND,
        pngchunk::tag_names::bKGD, pngchunk::tag_names::cHRM,
        pngchunk::tag_names::gAMA, pngchunk::tag_names::hIST,
        pngchunk::tag_names::iCCP, pngchunk::tag_names::iTXt,
        pngchunk::tag_names::pHYs, pngchunk::tag_names::sBIT,
        pngchunk::tag_names::sPLT, pngchunk::tag_names::sRGB,
        pngchunk::tag_names::tEXt, pngchunk::tag_names::tIME,
        pngchunk::tag_names::tRNS, pngchunk::tag_names::zTXt,
    };

    // Not std::isupper, the result must not depend on the C locale
    bool is_ascii_upper(uint8_t b) { return b >= 'A' && b <= 'Z'; }
    bool is_ascii_lower(uint8_t b) { return b >= 'a' && b <= 'z'; }
    bool is_ascii_letter(uint8_t b) {
        return is_ascii_upper(b) || is_ascii_lower(b);
    }

}  // namespace


namespace pngchunk {

    ChunkExp<TypeTag> TypeTag::from_bytes(const Bytes& bytes) {
        for (const auto b : bytes) {
            if (!::is_ascii_letter(b))
                return std::unexpected(ChunkErrc::invalid_tag_bytes);
        }

        return TypeTag(bytes);
    }

    ChunkExp<TypeTag> TypeTag::from_str(std::string_view str) {
        Bytes bytes;
        if (str.size() != bytes.size())
            return std::unexpected(ChunkErrc::invalid_tag_string);

        std::copy(str.begin(), str.end(), bytes.begin());
        return TypeTag::from_bytes(bytes);
    }

    bool TypeTag::is_valid() const { return this->is_reserved_bit_valid(); }

    bool TypeTag::is_critical() const { return ::is_ascii_upper(bytes_[0]); }

    bool TypeTag::is_public() const { return ::is_ascii_upper(bytes_[1]); }

    bool TypeTag::is_reserved_bit_valid() const {
        return ::is_ascii_upper(bytes_[2]);
    }

    bool TypeTag::is_safe_to_copy() const {
        return ::is_ascii_lower(bytes_[3]);
    }

    bool TypeTag::is_standard() const {
        const std::string_view name(
            reinterpret_cast<const char*>(bytes_.data()), bytes_.size()
        );
        return std::find(::STANDARD_TAGS.begin(), ::STANDARD_TAGS.end(), name) !=
               ::STANDARD_TAGS.end();
    }

    std::string TypeTag::to_str() const {
        return std::string(bytes_.begin(), bytes_.end());
    }

}  // namespace pngchunk
