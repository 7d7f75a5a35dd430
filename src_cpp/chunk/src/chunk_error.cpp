#include "pngchunk/chunk/chunk_error.hpp"


namespace pngchunk {

    const char* to_str(ChunkErrc errc) {
        switch (errc) {
            case ChunkErrc::invalid_tag_bytes:
                return "Invalid chunk type bytes";
            case ChunkErrc::invalid_tag_string:
                return "Chunk type string must be exactly 4 bytes";
            case ChunkErrc::checksum_mismatch:
                return "Chunk CRC mismatch";
            case ChunkErrc::non_utf8_payload:
                return "Chunk data is not valid UTF-8";
            case ChunkErrc::truncated_input:
                return "Chunk bytes are truncated";
            case ChunkErrc::length_overflow:
                return "Chunk length exceeds the allowed maximum";
        }
        return "Unknown chunk error";
    }

}  // namespace pngchunk
