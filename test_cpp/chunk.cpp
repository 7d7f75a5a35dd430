#include <array>
#include <format>
#include <print>
#include <string>
#include <vector>

#include "pngchunk/chunk/chunk.hpp"
#include "test_util.hpp"


namespace {

    using pngchunk::Chunk;
    using pngchunk::ChunkErrc;
    using pngchunk::TypeTag;

    const std::string MESSAGE = "This is where your secret message will be!";
    constexpr uint32_t MESSAGE_LENGTH = 42;
    constexpr uint32_t MESSAGE_CRC = 2882656334;


    std::vector<uint8_t> to_vec(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    void push_u32_be(std::vector<uint8_t>& out, uint32_t value) {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    // Hand assembled chunk bytes, independent of Chunk::to_bytes
    std::vector<uint8_t> assemble(
        uint32_t length,
        const std::string& type,
        const std::string& data,
        uint32_t crc
    ) {
        std::vector<uint8_t> out;
        ::push_u32_be(out, length);
        out.insert(out.end(), type.begin(), type.end());
        out.insert(out.end(), data.begin(), data.end());
        ::push_u32_be(out, crc);
        return out;
    }

    // Bitwise CRC-32 from the PNG spec's sample code, used as an oracle
    uint32_t reference_crc(const std::vector<uint8_t>& bytes) {
        uint32_t c = 0xFFFFFFFF;
        for (const auto b : bytes) {
            c ^= b;
            for (int k = 0; k < 8; ++k)
                c = (c & 1) ? (0xEDB88320 ^ (c >> 1)) : (c >> 1);
        }
        return c ^ 0xFFFFFFFF;
    }

    TypeTag rust_tag() { return *TypeTag::from_str("RuSt"); }


    void test_decode_message(pngchunk::test::Checker& t) {
        const auto bytes = ::assemble(
            MESSAGE_LENGTH, "RuSt", MESSAGE, MESSAGE_CRC
        );
        const auto chunk = Chunk::from_bytes(bytes.data(), bytes.size());
        if (!t.check(chunk.has_value(), "valid chunk decodes"))
            return;

        t.check(chunk->length() == MESSAGE_LENGTH, "length");
        t.check(chunk->type().to_str() == "RuSt", "type");
        t.check(chunk->crc() == MESSAGE_CRC, "crc");
        t.check(chunk->data() == ::to_vec(MESSAGE), "data");

        const auto text = chunk->data_as_str();
        t.check(text && *text == MESSAGE, "data as text");
    }

    void test_encode_message(pngchunk::test::Checker& t) {
        const Chunk chunk(::rust_tag(), ::to_vec(MESSAGE));

        t.check(chunk.length() == MESSAGE_LENGTH, "length");
        t.check(chunk.crc() == MESSAGE_CRC, "crc");

        const auto bytes = chunk.to_bytes();
        t.check(bytes.size() == 12 + MESSAGE_LENGTH, "encoded size");
        t.check(bytes.size() == chunk.byte_size(), "byte_size");
        t.check(
            bytes == ::assemble(MESSAGE_LENGTH, "RuSt", MESSAGE, MESSAGE_CRC),
            "exact byte layout"
        );
        t.check(
            bytes[0] == 0 && bytes[1] == 0 && bytes[2] == 0 &&
                bytes[3] == 0x2A,
            "length field is big endian"
        );

        const auto decoded = Chunk::from_bytes(bytes.data(), bytes.size());
        t.check(decoded && *decoded == chunk, "round trip");
        t.check(
            decoded && decoded->data_as_str().value_or("") == MESSAGE,
            "round trip text"
        );
    }

    void test_crc(pngchunk::test::Checker& t) {
        const Chunk chunk(::rust_tag(), ::to_vec(MESSAGE));
        t.check(chunk.crc() == chunk.crc(), "deterministic");

        std::vector<uint8_t> covered = { 'R', 'u', 'S', 't' };
        covered.insert(covered.end(), MESSAGE.begin(), MESSAGE.end());
        t.check(chunk.crc() == ::reference_crc(covered), "matches oracle");

        const std::vector<uint8_t> binary = { 0x00, 0xFF, 0x80, 0x7F, 0x0A };
        const auto tag = TypeTag::from_str("abCD");
        std::vector<uint8_t> binary_covered = { 'a', 'b', 'C', 'D' };
        binary_covered.insert(
            binary_covered.end(), binary.begin(), binary.end()
        );
        t.check(
            Chunk(*tag, binary).crc() == ::reference_crc(binary_covered),
            "binary payload matches oracle"
        );
        t.check(
            pngchunk::calc_crc(tag->bytes(), binary.data(), binary.size()) ==
                ::reference_crc(binary_covered),
            "calc_crc"
        );
    }

    void test_empty_payload(pngchunk::test::Checker& t) {
        const Chunk iend(*TypeTag::from_str("IEND"), {});
        const std::vector<uint8_t> expected = {
            0x00, 0x00, 0x00, 0x00, 'I', 'E', 'N', 'D', 0xAE, 0x42, 0x60, 0x82,
        };

        t.check(iend.length() == 0, "zero length");
        t.check(iend.to_bytes() == expected, "IEND encodes to 12 bytes");
        t.check(
            iend.crc() == ::reference_crc({ 'I', 'E', 'N', 'D' }),
            "crc covers the type alone"
        );

        const auto decoded = Chunk::from_bytes(expected.data(), expected.size());
        t.check(decoded && *decoded == iend, "empty round trip");
        t.check(
            decoded && decoded->data_as_str().value_or("x").empty(),
            "empty payload is empty text"
        );
    }

    void test_non_utf8(pngchunk::test::Checker& t) {
        const Chunk chunk(::rust_tag(), { 0xFF });

        const auto text = chunk.data_as_str();
        t.check(
            !text && text.error() == ChunkErrc::non_utf8_payload,
            "0xFF is not UTF-8"
        );
        t.check(chunk.length() == 1, "length unaffected");
        t.check(chunk.to_bytes().size() == 13, "encoding unaffected");

        const auto bytes = chunk.to_bytes();
        const auto decoded = Chunk::from_bytes(bytes.data(), bytes.size());
        t.check(decoded && *decoded == chunk, "decoding unaffected");

        const std::vector<std::vector<uint8_t>> invalid = {
            { 0xC0, 0xAF },              // overlong '/'
            { 0xE0, 0x80, 0xAF },        // overlong
            { 0xED, 0xA0, 0x80 },        // surrogate
            { 0xF4, 0x90, 0x80, 0x80 },  // above U+10FFFF
            { 0xE2, 0x82 },              // truncated sequence
            { 0x80 },                    // lone continuation
        };
        for (const auto& payload : invalid) {
            t.check(
                !Chunk(::rust_tag(), payload).data_as_str(),
                "invalid UTF-8 is rejected"
            );
        }

        const std::string multilingual = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x90\x8D";
        const Chunk utf8_chunk(::rust_tag(), ::to_vec(multilingual));
        t.check(
            utf8_chunk.data_as_str().value_or("") == multilingual,
            "multi byte UTF-8 is accepted"
        );
    }

    void test_bad_crc(pngchunk::test::Checker& t) {
        const auto bytes = ::assemble(
            MESSAGE_LENGTH, "RuSt", MESSAGE, MESSAGE_CRC - 1
        );
        const auto chunk = Chunk::from_bytes(bytes.data(), bytes.size());
        t.check(
            !chunk && chunk.error() == ChunkErrc::checksum_mismatch,
            "wrong stored crc"
        );
    }

    void test_bit_flips(pngchunk::test::Checker& t) {
        const auto bytes = Chunk(::rust_tag(), ::to_vec(MESSAGE)).to_bytes();

        // Every bit of the type and data fields
        const size_t end = 8 + MESSAGE_LENGTH;
        for (size_t i = 4; i < end; ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                auto tampered = bytes;
                tampered[i] ^= static_cast<uint8_t>(1 << bit);

                const auto chunk = Chunk::from_bytes(
                    tampered.data(), tampered.size()
                );
                if (chunk) {
                    t.check(false, std::format("flip {}:{} accepted", i, bit));
                    continue;
                }

                if (i < 8) {
                    t.check(
                        chunk.error() == ChunkErrc::checksum_mismatch ||
                            chunk.error() == ChunkErrc::invalid_tag_bytes,
                        "flipped type bit"
                    );
                } else {
                    t.check(
                        chunk.error() == ChunkErrc::checksum_mismatch,
                        "flipped data bit"
                    );
                }
            }
        }

        // Bit 5 toggles letter case, so the type stays valid
        auto case_flip = bytes;
        case_flip[6] ^= 0x20;
        const auto chunk = Chunk::from_bytes(case_flip.data(), case_flip.size());
        t.check(
            !chunk && chunk.error() == ChunkErrc::checksum_mismatch,
            "case flip is a crc mismatch"
        );
    }

    void test_invalid_type(pngchunk::test::Checker& t) {
        const std::string type = "Ru1t";
        std::vector<uint8_t> covered(type.begin(), type.end());
        const auto bytes = ::assemble(0, type, "", ::reference_crc(covered));

        const auto chunk = Chunk::from_bytes(bytes.data(), bytes.size());
        t.check(
            !chunk && chunk.error() == ChunkErrc::invalid_tag_bytes,
            "type with a digit is reported, not fatal"
        );
    }

    void test_truncated(pngchunk::test::Checker& t) {
        const auto bytes = Chunk(::rust_tag(), ::to_vec(MESSAGE)).to_bytes();

        for (size_t size = 0; size < bytes.size(); ++size) {
            const auto chunk = Chunk::from_bytes(bytes.data(), size);
            t.check(
                !chunk && chunk.error() == ChunkErrc::truncated_input,
                std::format("cut at {}", size)
            );
        }

        const auto null_chunk = Chunk::from_bytes(nullptr, 0);
        t.check(
            !null_chunk && null_chunk.error() == ChunkErrc::truncated_input,
            "null buffer"
        );

        // Declared length far beyond the buffer
        auto huge = bytes;
        huge[0] = 0x7F;
        const auto chunk = Chunk::from_bytes(huge.data(), huge.size());
        t.check(
            !chunk && chunk.error() == ChunkErrc::truncated_input,
            "declared length beyond buffer"
        );
    }

    void test_length_limit(pngchunk::test::Checker& t) {
        const auto bytes = Chunk(::rust_tag(), ::to_vec(MESSAGE)).to_bytes();

        pngchunk::CodecConfigs configs;
        configs.max_data_length_ = MESSAGE_LENGTH - 1;
        const auto rejected = Chunk::from_bytes(
            bytes.data(), bytes.size(), configs
        );
        t.check(
            !rejected && rejected.error() == ChunkErrc::length_overflow,
            "length above configured limit"
        );

        configs.max_data_length_ = MESSAGE_LENGTH;
        t.check(
            Chunk::from_bytes(bytes.data(), bytes.size(), configs).has_value(),
            "length at configured limit"
        );

        // Default limit is 2^31 - 1
        auto over = bytes;
        over[0] = 0x80;
        over[1] = over[2] = over[3] = 0x00;
        const auto chunk = Chunk::from_bytes(over.data(), over.size());
        t.check(
            !chunk && chunk.error() == ChunkErrc::length_overflow,
            "2^31 exceeds the default limit"
        );
    }

    void test_parse_stream(pngchunk::test::Checker& t) {
        const Chunk first(::rust_tag(), ::to_vec(MESSAGE));
        const Chunk second(*TypeTag::from_str("IEND"), {});

        auto stream = first.to_bytes();
        const auto second_bytes = second.to_bytes();
        stream.insert(stream.end(), second_bytes.begin(), second_bytes.end());

        const auto parsed = pngchunk::parse_chunk(stream.data(), stream.size());
        if (!t.check(parsed.has_value(), "first chunk of stream"))
            return;
        t.check(parsed->chunk == first, "first chunk");
        t.check(parsed->consumed == 12 + MESSAGE_LENGTH, "trailing untouched");

        const auto rest = stream.size() - parsed->consumed;
        const auto next = pngchunk::parse_chunk(
            stream.data() + parsed->consumed, rest
        );
        if (!t.check(next.has_value(), "second chunk of stream"))
            return;
        t.check(next->chunk == second, "second chunk");
        t.check(next->consumed == rest, "stream fully consumed");

        const auto failed = pngchunk::parse_chunk(stream.data(), 10);
        t.check(
            !failed && failed.error() == ChunkErrc::truncated_input,
            "errors pass through"
        );
    }

    void test_render(pngchunk::test::Checker& t) {
        const Chunk chunk(::rust_tag(), ::to_vec(MESSAGE));

        const auto text = chunk.to_str();
        t.check(text.find("length: 42") != std::string::npos, "length line");
        t.check(text.find("type: RuSt") != std::string::npos, "type line");
        t.check(text.find("data: 42 bytes") != std::string::npos, "data line");
        t.check(text.find("crc: 2882656334") != std::string::npos, "crc line");
        t.check(std::format("{}", chunk) == text, "formatter");

        const auto json = chunk.export_json();
        t.check(json.at("length").get<uint32_t>() == 42, "json length");
        t.check(json.at("type").get<std::string>() == "RuSt", "json type");
        t.check(json.at("crc").get<uint32_t>() == MESSAGE_CRC, "json crc");
        t.check(json.at("critical").get<bool>(), "json critical");
        t.check(!json.at("public").get<bool>(), "json public");
        t.check(json.at("safe_to_copy").get<bool>(), "json safe to copy");

        std::println("{}", chunk);
    }

    void test_error_messages(pngchunk::test::Checker& t) {
        const ChunkErrc all[] = {
            ChunkErrc::invalid_tag_bytes, ChunkErrc::invalid_tag_string,
            ChunkErrc::checksum_mismatch, ChunkErrc::non_utf8_payload,
            ChunkErrc::truncated_input,   ChunkErrc::length_overflow,
        };
        for (const auto errc : all) {
            t.check(!std::format("{}", errc).empty(), "error has a message");
        }
        t.check(
            std::format("{}", ChunkErrc::checksum_mismatch) ==
                pngchunk::to_str(ChunkErrc::checksum_mismatch),
            "formatter uses to_str"
        );
    }

}  // namespace


int main() {
    pngchunk::test::Checker t;

    ::test_decode_message(t);
    ::test_encode_message(t);
    ::test_crc(t);
    ::test_empty_payload(t);
    ::test_non_utf8(t);
    ::test_bad_crc(t);
    ::test_bit_flips(t);
    ::test_invalid_type(t);
    ::test_truncated(t);
    ::test_length_limit(t);
    ::test_parse_stream(t);
    ::test_render(t);
    ::test_error_messages(t);

    return t.finish("chunk");
}
