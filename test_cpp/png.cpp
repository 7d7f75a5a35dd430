#include <cstring>
#include <format>
#include <print>
#include <stdexcept>
#include <string>
#include <vector>

#include <png.h>
#include <zlib.h>

#include "pngchunk/auxiliary/err_str.hpp"
#include "pngchunk/chunk/chunk.hpp"
#include "test_util.hpp"


namespace {

    constexpr size_t PNG_SIG_SIZE = 8;
    const std::string SECRET = "This is where your secret message will be!";


    void png_throw_error(png_structp png_ptr, png_const_charp msg) {
        throw std::runtime_error(msg ? msg : "libpng error");
    }

    void png_silent_warning(png_structp png_ptr, png_const_charp msg) {}


    void png_vec_write(png_structp png_ptr, png_bytep data, png_size_t size) {
        auto* out = static_cast<std::vector<uint8_t>*>(
            png_get_io_ptr(png_ptr)
        );
        out->insert(out->end(), data, data + size);
    }

    void png_vec_flush(png_structp png_ptr) {}


    struct PngMemSource {
        const std::vector<uint8_t>* data;
        size_t pos;
    };

    void png_vec_read(png_structp png_ptr, png_bytep out, png_size_t size) {
        auto* src = static_cast<PngMemSource*>(png_get_io_ptr(png_ptr));
        if (!src || src->pos + size > src->data->size())
            png_error(png_ptr, "Read error");

        std::memcpy(out, src->data->data() + src->pos, size);
        src->pos += size;
    }


    // 2x2 RGBA image with one tEXt chunk, written by libpng
    class PngMemWriter {

    public:
        PngMemWriter() = default;

        ~PngMemWriter() { this->destroy(); }

        pngchunk::ErrStr write(std::vector<uint8_t>& out) {
            this->destroy();

            png_ptr_ = png_create_write_struct(
                PNG_LIBPNG_VER_STRING, nullptr, png_throw_error, nullptr
            );
            if (!png_ptr_)
                return std::unexpected("png_create_write_struct failed");

            info_ptr_ = png_create_info_struct(png_ptr_);
            if (!info_ptr_)
                return std::unexpected("png_create_info_struct failed");

            try {
                png_set_write_fn(png_ptr_, &out, png_vec_write, png_vec_flush);
                png_set_IHDR(
                    png_ptr_,
                    info_ptr_,
                    2,
                    2,
                    8,
                    PNG_COLOR_TYPE_RGBA,
                    PNG_INTERLACE_NONE,
                    PNG_COMPRESSION_TYPE_DEFAULT,
                    PNG_FILTER_TYPE_DEFAULT
                );

                std::string key = "Comment";
                std::string value = SECRET;
                png_text text{};
                text.compression = PNG_TEXT_COMPRESSION_NONE;
                text.key = key.data();
                text.text = value.data();
                text.text_length = value.size();
                png_set_text(png_ptr_, info_ptr_, &text, 1);

                png_write_info(png_ptr_, info_ptr_);

                std::vector<png_byte> pixels = {
                    255, 0, 0, 255, 0, 255, 0, 255,  // row 0
                    0, 0, 255, 255, 9, 9, 9, 128,    // row 1
                };
                png_bytep rows[] = { pixels.data(), pixels.data() + 8 };
                png_write_image(png_ptr_, rows);
                png_write_end(png_ptr_, nullptr);
            } catch (const std::exception& e) {
                return std::unexpected(
                    std::format("Failed to write PNG: {}", e.what())
                );
            }

            return {};
        }

        void destroy() {
            if (png_ptr_ || info_ptr_) {
                png_destroy_write_struct(&png_ptr_, &info_ptr_);
                png_ptr_ = nullptr;
                info_ptr_ = nullptr;
            }
        }

    private:
        png_structp png_ptr_ = nullptr;
        png_infop info_ptr_ = nullptr;
    };


    struct DecodedPng {
        png_uint_32 width = 0;
        png_uint_32 height = 0;
        std::vector<uint8_t> pixels;
        std::vector<std::string> unknown_names;
        std::vector<std::vector<uint8_t>> unknown_data;
    };

    // Reads a PNG with every CRC error treated as fatal
    class PngMemReader {

    public:
        PngMemReader() = default;

        ~PngMemReader() { this->destroy(); }

        pngchunk::ErrStr read(const std::vector<uint8_t>& src, DecodedPng& out) {
            this->destroy();

            if (src.size() < PNG_SIG_SIZE || png_sig_cmp(src.data(), 0, 8))
                return std::unexpected("Not a PNG file");

            png_ptr_ = png_create_read_struct(
                PNG_LIBPNG_VER_STRING,
                nullptr,
                png_throw_error,
                png_silent_warning
            );
            if (!png_ptr_)
                return std::unexpected("png_create_read_struct failed");

            info_ptr_ = png_create_info_struct(png_ptr_);
            if (!info_ptr_)
                return std::unexpected("png_create_info_struct failed");

            source_ = PngMemSource{ &src, 0 };

            try {
                png_set_read_fn(png_ptr_, &source_, png_vec_read);
                png_set_crc_action(
                    png_ptr_, PNG_CRC_ERROR_QUIT, PNG_CRC_ERROR_QUIT
                );
                png_set_keep_unknown_chunks(
                    png_ptr_, PNG_HANDLE_CHUNK_ALWAYS, nullptr, 0
                );

                png_read_info(png_ptr_, info_ptr_);
                out.width = png_get_image_width(png_ptr_, info_ptr_);
                out.height = png_get_image_height(png_ptr_, info_ptr_);

                const auto rowbytes = png_get_rowbytes(png_ptr_, info_ptr_);
                out.pixels.resize(rowbytes * out.height);
                std::vector<png_bytep> rows(out.height);
                for (png_uint_32 y = 0; y < out.height; ++y)
                    rows[y] = out.pixels.data() + y * rowbytes;

                png_read_image(png_ptr_, rows.data());
                png_read_end(png_ptr_, info_ptr_);

                png_unknown_chunkp unknowns = nullptr;
                const auto num_unknowns = png_get_unknown_chunks(
                    png_ptr_, info_ptr_, &unknowns
                );
                for (int i = 0; i < num_unknowns; ++i) {
                    const auto& u = unknowns[i];
                    out.unknown_names.emplace_back(
                        reinterpret_cast<const char*>(u.name), 4
                    );
                    out.unknown_data.emplace_back(u.data, u.data + u.size);
                }
            } catch (const std::exception& e) {
                return std::unexpected(
                    std::format("Failed to read PNG: {}", e.what())
                );
            }

            return {};
        }

        void destroy() {
            if (png_ptr_ || info_ptr_) {
                png_destroy_read_struct(&png_ptr_, &info_ptr_, nullptr);
                png_ptr_ = nullptr;
                info_ptr_ = nullptr;
            }
        }

    private:
        PngMemSource source_{ nullptr, 0 };
        png_structp png_ptr_ = nullptr;
        png_infop info_ptr_ = nullptr;
    };


    std::vector<uint8_t> make_ihdr_data(uint32_t width, uint32_t height) {
        std::vector<uint8_t> data;
        for (const auto v : { width, height }) {
            data.push_back(static_cast<uint8_t>(v >> 24));
            data.push_back(static_cast<uint8_t>(v >> 16));
            data.push_back(static_cast<uint8_t>(v >> 8));
            data.push_back(static_cast<uint8_t>(v));
        }
        data.push_back(8);  // bit depth
        data.push_back(0);  // greyscale
        data.push_back(0);  // deflate
        data.push_back(0);  // adaptive filtering
        data.push_back(0);  // no interlace
        return data;
    }

    pngchunk::Chunk make_chunk(std::string_view type, std::vector<uint8_t> data) {
        return pngchunk::Chunk(
            *pngchunk::TypeTag::from_str(type), std::move(data)
        );
    }

    void append(std::vector<uint8_t>& dst, const pngchunk::Chunk& chunk) {
        const auto bytes = chunk.to_bytes();
        dst.insert(dst.end(), bytes.begin(), bytes.end());
    }


    // Chunks written by libpng decode with the codec
    void test_decode_libpng_output(pngchunk::test::Checker& t) {
        std::vector<uint8_t> file;
        PngMemWriter writer;
        const auto res = writer.write(file);
        if (!t.check(res.has_value(), "libpng writes a PNG")) {
            std::println("{}", res.error());
            return;
        }

        std::vector<pngchunk::Chunk> chunks;
        size_t pos = PNG_SIG_SIZE;
        while (pos < file.size()) {
            const auto parsed = pngchunk::parse_chunk(
                file.data() + pos, file.size() - pos
            );
            if (!parsed) {
                t.check(false, std::format("chunk at {}: {}", pos, parsed.error()));
                return;
            }

            std::println("{} at offset {}", parsed->chunk.type(), pos);
            pos += parsed->consumed;
            chunks.push_back(parsed->chunk);
        }

        t.check(pos == file.size(), "chunks cover the whole file");
        if (!t.check(chunks.size() >= 4, "IHDR, tEXt, IDAT and IEND"))
            return;

        namespace names = pngchunk::tag_names;
        const auto& ihdr = chunks.front();
        t.check(ihdr.type().to_str() == names::IHDR, "IHDR first");
        t.check(ihdr.length() == 13, "IHDR length");
        t.check(ihdr.type().is_critical(), "IHDR is critical");
        t.check(chunks.back().type().to_str() == names::IEND, "IEND last");
        t.check(chunks.back().length() == 0, "IEND is empty");

        bool found_text = false;
        bool found_idat = false;
        for (const auto& chunk : chunks) {
            t.check(chunk.type().is_standard(), "libpng writes standard tags");
            t.check(chunk.type().is_valid(), "reserved bit is clear");
            t.check(chunk.to_bytes().size() == chunk.byte_size(), "size");

            if (chunk.type().to_str() == names::IDAT)
                found_idat = true;
            if (chunk.type().to_str() != names::tEXt)
                continue;

            // keyword NUL text
            const auto text = chunk.data_as_str();
            if (!t.check(text.has_value(), "tEXt is ASCII here"))
                continue;
            const auto sep = text->find('\0');
            t.check(text->substr(0, sep) == "Comment", "tEXt keyword");
            t.check(text->substr(sep + 1) == SECRET, "tEXt value");
            found_text = true;
        }
        t.check(found_text, "tEXt found");
        t.check(found_idat, "IDAT found");

        // Re-encoding reproduces libpng's bytes exactly
        std::vector<uint8_t> rebuilt(file.begin(), file.begin() + PNG_SIG_SIZE);
        for (const auto& chunk : chunks)
            ::append(rebuilt, chunk);
        t.check(rebuilt == file, "byte identical re-encoding");
    }

    // Chunks built by the codec are accepted by libpng
    void test_libpng_reads_codec_output(pngchunk::test::Checker& t) {
        // Filter byte 0 then two grey pixels, per row
        const std::vector<uint8_t> raw = { 0, 10, 20, 0, 30, 40 };
        std::vector<uint8_t> compressed(compressBound(raw.size()));
        uLongf compressed_size = compressed.size();
        const auto zres = compress2(
            compressed.data(),
            &compressed_size,
            raw.data(),
            raw.size(),
            Z_BEST_COMPRESSION
        );
        if (!t.check(zres == Z_OK, "deflate pixel rows"))
            return;
        compressed.resize(compressed_size);

        std::vector<uint8_t> file = {
            0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n',
        };
        ::append(file, ::make_chunk("IHDR", ::make_ihdr_data(2, 2)));
        ::append(
            file,
            ::make_chunk("ruSt", std::vector<uint8_t>(SECRET.begin(), SECRET.end()))
        );
        ::append(file, ::make_chunk("IDAT", compressed));
        ::append(file, ::make_chunk("IEND", {}));

        DecodedPng decoded;
        PngMemReader reader;
        const auto res = reader.read(file, decoded);
        if (!t.check(res.has_value(), "libpng reads codec output")) {
            std::println("{}", res.error());
            return;
        }

        t.check(decoded.width == 2 && decoded.height == 2, "dimensions");
        t.check(
            decoded.pixels == std::vector<uint8_t>({ 10, 20, 30, 40 }),
            "pixels"
        );

        bool found = false;
        for (size_t i = 0; i < decoded.unknown_names.size(); ++i) {
            if (decoded.unknown_names[i] != "ruSt")
                continue;
            found = true;
            t.check(
                decoded.unknown_data[i] ==
                    std::vector<uint8_t>(SECRET.begin(), SECRET.end()),
                "custom chunk data survives libpng"
            );
        }
        t.check(found, "custom chunk kept by libpng");

        // libpng must reject a corrupted CRC the codec also rejects
        auto corrupted = file;
        corrupted[PNG_SIG_SIZE + 8] ^= 0x01;  // first IHDR data byte
        const auto bad = pngchunk::parse_chunk(
            corrupted.data() + PNG_SIG_SIZE, corrupted.size() - PNG_SIG_SIZE
        );
        t.check(
            !bad && bad.error() == pngchunk::ChunkErrc::checksum_mismatch,
            "codec rejects corrupted IHDR"
        );

        DecodedPng ignored;
        PngMemReader strict_reader;
        t.check(
            !strict_reader.read(corrupted, ignored).has_value(),
            "libpng rejects corrupted IHDR"
        );
    }

}  // namespace


int main() {
    pngchunk::test::Checker t;

    ::test_decode_libpng_output(t);
    ::test_libpng_reads_codec_output(t);

    return t.finish("png");
}
