#include <fstream>
#include <print>

#include "pngchunk/auxiliary/codec_configs.hpp"
#include "test_util.hpp"


namespace {

    using pngchunk::CodecConfigs;


    pngchunk::Path write_temp_file(const char* name, const char* content) {
        const auto path = pngchunk::fs::temp_directory_path() / name;
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs << content;
        return path;
    }


    void test_defaults(pngchunk::test::Checker& t) {
        CodecConfigs configs;
        t.check(configs.max_data_length_ == 0x7FFFFFFF, "initial value");

        configs.max_data_length_ = 5;
        configs.fill_default();
        t.check(
            configs.max_data_length_ == CodecConfigs::DEFAULT_MAX_DATA_LENGTH,
            "fill_default"
        );
    }

    void test_json(pngchunk::test::Checker& t) {
        CodecConfigs configs;
        configs.import_json(nlohmann::json{ { "max_data_length", 1024 } });
        t.check(configs.max_data_length_ == 1024, "import");

        const auto exported = configs.export_json();
        t.check(exported.at("max_data_length") == 1024, "export");

        CodecConfigs reimported;
        reimported.import_json(exported);
        t.check(reimported.max_data_length_ == 1024, "reimport");

        configs.import_json(nlohmann::json::object());
        t.check(
            configs.max_data_length_ == CodecConfigs::DEFAULT_MAX_DATA_LENGTH,
            "missing key falls back to default"
        );

        configs.import_json(
            nlohmann::json{ { "max_data_length", 4294967295u } }
        );
        t.check(configs.max_data_length_ == 0xFFFFFFFF, "u32 maximum");
    }

    void test_invalid_json(pngchunk::test::Checker& t) {
        const nlohmann::json bad_values[] = {
            nlohmann::json{ { "max_data_length", "big" } },
            nlohmann::json{ { "max_data_length", 1.5 } },
            nlohmann::json{ { "max_data_length", -1 } },
            nlohmann::json{ { "max_data_length", 4294967296ll } },
        };

        for (const auto& json : bad_values) {
            CodecConfigs configs;
            bool thrown = false;
            try {
                configs.import_json(json);
            } catch (const std::runtime_error& e) {
                thrown = true;
                std::println("Rejected as expected: {}", e.what());
            }
            t.check(thrown, json.dump());
        }
    }

    void test_load_file(pngchunk::test::Checker& t) {
        {
            const auto path = ::write_temp_file(
                "pngchunk_configs_ok.json", R"({ "max_data_length": 77 })"
            );
            const auto configs = pngchunk::load_codec_configs(path);
            t.check(
                configs && configs->max_data_length_ == 77, "load from file"
            );
            pngchunk::fs::remove(path);
        }

        {
            const auto path = ::write_temp_file(
                "pngchunk_configs_broken.json", "{ not json"
            );
            const auto configs = pngchunk::load_codec_configs(path);
            t.check(!configs, "malformed JSON is an error");
            if (!configs)
                std::println("Error message: {}", configs.error());
            pngchunk::fs::remove(path);
        }

        {
            const auto path = ::write_temp_file(
                "pngchunk_configs_type.json", R"({ "max_data_length": [] })"
            );
            const auto configs = pngchunk::load_codec_configs(path);
            t.check(!configs, "wrong type is an error");
            pngchunk::fs::remove(path);
        }

        {
            const auto path = pngchunk::fs::temp_directory_path() /
                              "pngchunk_configs_missing.json";
            pngchunk::fs::remove(path);
            const auto configs = pngchunk::load_codec_configs(path);
            t.check(
                configs && configs->max_data_length_ ==
                               CodecConfigs::DEFAULT_MAX_DATA_LENGTH,
                "missing file gives defaults"
            );
        }
    }

}  // namespace


int main() {
    pngchunk::test::Checker t;

    ::test_defaults(t);
    ::test_json(t);
    ::test_invalid_json(t);
    ::test_load_file(t);

    return t.finish("codec_configs");
}
