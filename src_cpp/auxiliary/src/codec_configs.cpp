#include "pngchunk/auxiliary/codec_configs.hpp"

#include <limits>
#include <print>
#include <stdexcept>


namespace {

    uint32_t try_get_u32(
        const nlohmann::json& j, const char* key, uint32_t default_value
    ) {
        if (!j.contains(key))
            return default_value;

        const auto& value = j.at(key);
        if (!value.is_number_integer())
            throw std::runtime_error(
                "Invalid type for key '" + std::string(key) + "'"
            );

        const auto number = value.get<int64_t>();
        if (number < 0 || number > std::numeric_limits<uint32_t>::max())
            throw std::runtime_error(
                "Value out of range for key '" + std::string(key) + "'"
            );

        return static_cast<uint32_t>(number);
    }

}  // namespace


// CodecConfigs
namespace pngchunk {

    void CodecConfigs::fill_default() {
        max_data_length_ = DEFAULT_MAX_DATA_LENGTH;
    }

    void CodecConfigs::import_json(const nlohmann::json& json_data) {
        max_data_length_ = ::try_get_u32(
            json_data, "max_data_length", DEFAULT_MAX_DATA_LENGTH
        );
    }

    nlohmann::json CodecConfigs::export_json() const {
        auto output = nlohmann::json::object();
        output["max_data_length"] = max_data_length_;
        return output;
    }

}  // namespace pngchunk


// Free functions
namespace pngchunk {

    std::expected<CodecConfigs, std::string> load_codec_configs(
        const Path& path
    ) {
        CodecConfigs configs;

        if (!fs::exists(path)) {
            configs.fill_default();
            return configs;
        }

        std::println(
            "Loading codec configs from file: {}", tostr(fs::absolute(path))
        );

        const auto content = read_text_file(path);
        if (!content)
            return std::unexpected(content.error());

        nlohmann::json json_data;
        try {
            json_data = nlohmann::json::parse(*content);
        } catch (const nlohmann::json::parse_error& e) {
            return std::unexpected(e.what());
        }

        try {
            configs.import_json(json_data);
        } catch (const std::exception& e) {
            return std::unexpected(e.what());
        }

        return configs;
    }

}  // namespace pngchunk
