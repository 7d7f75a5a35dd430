#pragma once

#include <expected>
#include <string>


namespace pngchunk {

    using ErrStr = std::expected<void, std::string>;

}  // namespace pngchunk
