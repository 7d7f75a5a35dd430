#include <format>
#include <print>

#include "pngchunk/chunk/type_tag.hpp"
#include "test_util.hpp"


namespace {

    using pngchunk::ChunkErrc;
    using pngchunk::TypeTag;


    void test_from_bytes(pngchunk::test::Checker& t) {
        const TypeTag::Bytes expected{ 82, 117, 83, 116 };
        const auto tag = TypeTag::from_bytes(expected);
        if (!t.check(tag.has_value(), "RuSt from bytes"))
            return;
        t.check(tag->bytes() == expected, "bytes are kept verbatim");
    }

    void test_from_str(pngchunk::test::Checker& t) {
        const auto from_bytes = TypeTag::from_bytes({ 82, 117, 83, 116 });
        const auto from_str = TypeTag::from_str("RuSt");
        if (!t.check(from_bytes && from_str, "RuSt from both paths"))
            return;
        t.check(*from_bytes == *from_str, "both paths compare equal");
        t.check(
            *from_str != *TypeTag::from_str("RUST"), "case is significant"
        );
    }

    void test_flags(pngchunk::test::Checker& t) {
        const auto rust = TypeTag::from_str("RuSt");
        if (!t.check(rust.has_value(), "RuSt"))
            return;
        t.check(rust->is_critical(), "RuSt is critical");
        t.check(!rust->is_public(), "RuSt is private");
        t.check(rust->is_reserved_bit_valid(), "RuSt reserved bit valid");
        t.check(rust->is_safe_to_copy(), "RuSt is safe to copy");
        t.check(rust->is_valid(), "RuSt is valid");

        t.check(!TypeTag::from_str("ruSt")->is_critical(), "ruSt ancillary");
        t.check(TypeTag::from_str("RUSt")->is_public(), "RUSt public");
        t.check(
            !TypeTag::from_str("RuST")->is_safe_to_copy(), "RuST unsafe copy"
        );

        const auto lower = TypeTag::from_str("Rust");
        if (!t.check(lower.has_value(), "Rust is still constructible"))
            return;
        t.check(!lower->is_reserved_bit_valid(), "Rust reserved bit invalid");
        t.check(!lower->is_valid(), "Rust is not valid");
    }

    void test_invalid_bytes(pngchunk::test::Checker& t) {
        const auto digit = TypeTag::from_str("Ru1t");
        t.check(
            !digit && digit.error() == ChunkErrc::invalid_tag_bytes,
            "digit is rejected"
        );

        const TypeTag::Bytes symbols[] = {
            { '@', 'u', 'S', 't' },  // one below 'A'
            { 'R', '[', 'S', 't' },  // one above 'Z'
            { 'R', 'u', '`', 't' },  // one below 'a'
            { 'R', 'u', 'S', '{' },  // one above 'z'
            { 'R', 'u', 'S', 0xE9 },
            { 0, 0, 0, 0 },
        };
        for (const auto& bytes : symbols) {
            const auto tag = TypeTag::from_bytes(bytes);
            t.check(
                !tag && tag.error() == ChunkErrc::invalid_tag_bytes,
                "non letter byte is rejected"
            );
        }

        t.check(TypeTag::from_str("AZaz").has_value(), "letter boundaries");
    }

    void test_invalid_str(pngchunk::test::Checker& t) {
        for (const auto str : { "", "RuS", "RuStX", "IHDR\n" }) {
            const auto tag = TypeTag::from_str(str);
            t.check(
                !tag && tag.error() == ChunkErrc::invalid_tag_string,
                std::format("wrong length string '{}'", str)
            );
        }

        // Length is checked on bytes, not characters
        const auto multibyte = TypeTag::from_str("R\xC3\xA9");
        t.check(
            !multibyte && multibyte.error() == ChunkErrc::invalid_tag_string,
            "3 byte string is rejected by length"
        );
        const auto four_bytes = TypeTag::from_str("Ru\xC3\xA9");
        t.check(
            !four_bytes && four_bytes.error() == ChunkErrc::invalid_tag_bytes,
            "4 byte non ASCII string fails the letter check"
        );
    }

    void test_to_str(pngchunk::test::Checker& t) {
        const auto tag = TypeTag::from_str("RuSt");
        if (!t.check(tag.has_value(), "RuSt"))
            return;
        t.check(tag->to_str() == "RuSt", "to_str");
        t.check(std::format("{}", *tag) == "RuSt", "formatter");
        t.check(std::format("[{:>6}]", *tag) == "[  RuSt]", "format spec");
    }

    void test_standard(pngchunk::test::Checker& t) {
        namespace names = pngchunk::tag_names;
        for (const auto name : { names::IHDR, names::IEND, names::tEXt }) {
            const auto tag = TypeTag::from_str(name);
            t.check(tag && tag->is_standard(), std::format("{}", name));
        }

        t.check(!TypeTag::from_str("RuSt")->is_standard(), "RuSt custom");
        t.check(!TypeTag::from_str("ihdr")->is_standard(), "case matters");

        const auto ihdr = TypeTag::from_str(names::IHDR);
        t.check(ihdr->is_critical() && ihdr->is_public(), "IHDR flags");
        const auto text = TypeTag::from_str(names::tEXt);
        t.check(
            !text->is_critical() && text->is_safe_to_copy(), "tEXt flags"
        );
    }

}  // namespace


int main() {
    pngchunk::test::Checker t;

    ::test_from_bytes(t);
    ::test_from_str(t);
    ::test_flags(t);
    ::test_invalid_bytes(t);
    ::test_invalid_str(t);
    ::test_to_str(t);
    ::test_standard(t);

    return t.finish("type_tag");
}
