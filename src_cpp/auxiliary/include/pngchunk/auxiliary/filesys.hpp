#pragma once

#include <expected>
#include <filesystem>
#include <string>


namespace pngchunk {

    namespace fs = std::filesystem;

    using Path = std::filesystem::path;


    std::string tostr(const Path& path);

    std::expected<std::string, std::string> read_text_file(const Path& path);

}  // namespace pngchunk
