#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "pngchunk/auxiliary/codec_configs.hpp"
#include "pngchunk/chunk/chunk_error.hpp"
#include "pngchunk/chunk/type_tag.hpp"


namespace pngchunk {

    /**
     * One PNG chunk.
     *
     * Byte layout, all integers big endian:
     *     [length: 4][type: 4][data: length][crc: 4]
     *
     * The CRC covers the type and data fields. A Chunk always holds a CRC
     * that matches its type and data.
     */
    class Chunk {

    public:
        // length + type + crc
        static constexpr size_t OVERHEAD_SIZE = 12;

    public:
        Chunk(TypeTag type, std::vector<uint8_t> data);

        /**
         * Decodes one chunk from the start of the buffer.
         *
         * Bytes after the end of the chunk are left untouched. Fails if the
         * buffer is shorter than the declared chunk, if the declared length
         * exceeds configs.max_data_length_, if the type is not 4 letters or
         * if the stored CRC does not match.
         */
        static ChunkExp<Chunk> from_bytes(
            const uint8_t* data,
            size_t size,
            const CodecConfigs& configs = CodecConfigs{}
        );

        uint32_t length() const { return length_; }
        const TypeTag& type() const { return type_; }
        const std::vector<uint8_t>& data() const { return data_; }

        // Recomputed from type and data on each call
        uint32_t crc() const;

        ChunkExp<std::string> data_as_str() const;

        std::vector<uint8_t> to_bytes() const;

        // Encoded size, OVERHEAD_SIZE + length
        size_t byte_size() const { return OVERHEAD_SIZE + data_.size(); }

        std::string to_str() const;
        nlohmann::json export_json() const;

        bool operator==(const Chunk& rhs) const = default;

    private:
        Chunk(TypeTag type, std::vector<uint8_t> data, uint32_t crc);

        uint32_t length_;
        TypeTag type_;
        std::vector<uint8_t> data_;
        uint32_t crc_;
    };


    struct ParsedChunk {
        Chunk chunk;
        size_t consumed;  // Bytes read from the buffer, chunk.byte_size()
    };

    // Same as Chunk::from_bytes, for callers walking a chunk stream
    ChunkExp<ParsedChunk> parse_chunk(
        const uint8_t* data,
        size_t size,
        const CodecConfigs& configs = CodecConfigs{}
    );

    // CRC-32 (ISO 3309 / ITU-T V.42) over type followed by data
    uint32_t calc_crc(
        const TypeTag::Bytes& type, const uint8_t* data, size_t size
    );

}  // namespace pngchunk


template <>
struct std::formatter<pngchunk::Chunk> : std::formatter<std::string_view> {
    template <typename TContext>
    auto format(const pngchunk::Chunk& chunk, TContext& ctx) const {
        return std::formatter<std::string_view>::format(chunk.to_str(), ctx);
    }
};
