#include "pngchunk/chunk/chunk.hpp"

#include <algorithm>
#include <utility>

#include <zlib.h>

#include "pngchunk/auxiliary/byte_util.hpp"


namespace {

    constexpr size_t LENGTH_FIELD_SIZE = 4;
    constexpr size_t TYPE_FIELD_SIZE = 4;
    constexpr size_t CRC_FIELD_SIZE = 4;
    constexpr size_t HEADER_SIZE = LENGTH_FIELD_SIZE + TYPE_FIELD_SIZE;

}  // namespace


// Chunk
namespace pngchunk {

    Chunk::Chunk(TypeTag type, std::vector<uint8_t> data)
        : length_(static_cast<uint32_t>(data.size()))
        , type_(std::move(type))
        , data_(std::move(data))
        , crc_(calc_crc(type_.bytes(), data_.data(), data_.size())) {}

    Chunk::Chunk(TypeTag type, std::vector<uint8_t> data, uint32_t crc)
        : length_(static_cast<uint32_t>(data.size()))
        , type_(std::move(type))
        , data_(std::move(data))
        , crc_(crc) {}

    ChunkExp<Chunk> Chunk::from_bytes(
        const uint8_t* data, size_t size, const CodecConfigs& configs
    ) {
        if (!data || size < ::HEADER_SIZE)
            return std::unexpected(ChunkErrc::truncated_input);

        // ---- Header ----

        const auto data_length = read_u32_be(data);
        if (data_length > configs.max_data_length_)
            return std::unexpected(ChunkErrc::length_overflow);

        TypeTag::Bytes type_bytes;
        std::copy_n(data + ::LENGTH_FIELD_SIZE, 4, type_bytes.begin());
        auto type = TypeTag::from_bytes(type_bytes);
        if (!type)
            return std::unexpected(type.error());

        // Checked without computing 12 + length, which may wrap on 32 bit
        const auto remaining = size - ::HEADER_SIZE;
        if (remaining < ::CRC_FIELD_SIZE ||
            remaining - ::CRC_FIELD_SIZE < data_length)
            return std::unexpected(ChunkErrc::truncated_input);

        // ---- Data & CRC ----

        const uint8_t* payload = data + ::HEADER_SIZE;
        const auto stored_crc = read_u32_be(payload + data_length);
        const auto actual_crc = calc_crc(type_bytes, payload, data_length);
        if (stored_crc != actual_crc)
            return std::unexpected(ChunkErrc::checksum_mismatch);

        return Chunk(
            std::move(*type),
            std::vector<uint8_t>(payload, payload + data_length),
            stored_crc
        );
    }

    uint32_t Chunk::crc() const {
        return calc_crc(type_.bytes(), data_.data(), data_.size());
    }

    ChunkExp<std::string> Chunk::data_as_str() const {
        if (!is_valid_utf8(data_.data(), data_.size()))
            return std::unexpected(ChunkErrc::non_utf8_payload);

        return std::string(data_.begin(), data_.end());
    }

    std::vector<uint8_t> Chunk::to_bytes() const {
        std::vector<uint8_t> output;
        output.reserve(this->byte_size());

        append_u32_be(output, length_);
        output.insert(output.end(), type_.bytes().begin(), type_.bytes().end());
        output.insert(output.end(), data_.begin(), data_.end());
        append_u32_be(output, crc_);

        return output;
    }

    std::string Chunk::to_str() const {
        std::string output = "Chunk {\n";
        output += std::format("    length: {}\n", length_);
        output += std::format("    type: {}\n", type_);
        output += std::format("    data: {} bytes\n", data_.size());
        output += std::format("    crc: {}\n", this->crc());
        output += "}";
        return output;
    }

    nlohmann::json Chunk::export_json() const {
        auto output = nlohmann::json::object();

        output["length"] = length_;
        output["type"] = type_.to_str();
        output["data_size"] = data_.size();
        output["crc"] = this->crc();

        output["critical"] = type_.is_critical();
        output["public"] = type_.is_public();
        output["reserved_bit_valid"] = type_.is_reserved_bit_valid();
        output["safe_to_copy"] = type_.is_safe_to_copy();

        return output;
    }

}  // namespace pngchunk


// Free functions
namespace pngchunk {

    ChunkExp<ParsedChunk> parse_chunk(
        const uint8_t* data, size_t size, const CodecConfigs& configs
    ) {
        auto chunk = Chunk::from_bytes(data, size, configs);
        if (!chunk)
            return std::unexpected(chunk.error());

        const auto consumed = chunk->byte_size();
        return ParsedChunk{ std::move(*chunk), consumed };
    }

    uint32_t calc_crc(
        const TypeTag::Bytes& type, const uint8_t* data, size_t size
    ) {
        uLong crc = ::crc32(0L, Z_NULL, 0);
        crc = ::crc32(crc, type.data(), static_cast<uInt>(type.size()));
        if (size > 0)
            crc = ::crc32_z(crc, data, size);
        return static_cast<uint32_t>(crc);
    }

}  // namespace pngchunk
