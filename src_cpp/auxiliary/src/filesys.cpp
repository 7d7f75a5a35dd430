#include "pngchunk/auxiliary/filesys.hpp"

#include <format>
#include <fstream>
#include <sstream>


namespace pngchunk {

    std::string tostr(const Path& path) {
        const auto u8str = path.generic_u8string();
        return std::string(u8str.begin(), u8str.end());
    }

    std::expected<std::string, std::string> read_text_file(const Path& path) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return std::unexpected(
                std::format("Failed to open file: {}", tostr(path))
            );

        std::ostringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

}  // namespace pngchunk
