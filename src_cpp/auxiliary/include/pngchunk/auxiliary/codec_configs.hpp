#pragma once

#include <cstdint>
#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "pngchunk/auxiliary/filesys.hpp"


namespace pngchunk {

    class CodecConfigs {

    public:
        // The PNG length field is limited to 2^31 - 1
        static constexpr uint32_t DEFAULT_MAX_DATA_LENGTH = 0x7FFFFFFF;

    public:
        void fill_default();

        void import_json(const nlohmann::json& json_data);
        nlohmann::json export_json() const;

    public:
        // Largest declared payload length the decoder accepts
        uint32_t max_data_length_ = DEFAULT_MAX_DATA_LENGTH;
    };


    /**
     * Reads codec configs from a JSON file.
     *
     * A missing file yields the defaults. Malformed JSON or a key with the
     * wrong type is reported as an error message.
     */
    std::expected<CodecConfigs, std::string> load_codec_configs(
        const Path& path
    );

}  // namespace pngchunk
