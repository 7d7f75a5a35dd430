#pragma once

#include <print>
#include <source_location>
#include <string_view>


namespace pngchunk::test {

    class Checker {

    public:
        bool check(
            bool condition,
            std::string_view what,
            std::source_location loc = std::source_location::current()
        ) {
            ++total_;
            if (!condition) {
                ++failed_;
                std::println(
                    "FAILED {}:{}: {}", loc.file_name(), loc.line(), what
                );
            }
            return condition;
        }

        // Returns the process exit code
        int finish(std::string_view suite_name) const {
            std::println(
                "[{}] {} checks, {} failed", suite_name, total_, failed_
            );
            return failed_ == 0 ? 0 : 1;
        }

    private:
        int total_ = 0;
        int failed_ = 0;
    };

}  // namespace pngchunk::test
