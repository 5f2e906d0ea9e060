#include <arbor/headers.hpp>

#include <algorithm>
#include <cctype>

namespace {
    auto lower(char c) noexcept -> char {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

namespace arbor {
    auto case_insensitive_less::operator()(
        std::string_view a,
        std::string_view b
    ) const noexcept -> bool {
        return std::lexicographical_compare(
            a.begin(), a.end(),
            b.begin(), b.end(),
            [](char x, char y) { return lower(x) < lower(y); }
        );
    }

    auto to_lower(std::string_view string) -> std::string {
        auto result = std::string(string);
        for (auto& c : result) c = lower(c);
        return result;
    }

    auto to_upper(std::string_view string) -> std::string {
        auto result = std::string(string);

        for (auto& c : result) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        return result;
    }
}
