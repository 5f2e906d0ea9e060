#pragma once

#include <map>
#include <string>
#include <string_view>

namespace arbor {
    struct case_insensitive_less {
        using is_transparent = void;

        auto operator()(
            std::string_view a,
            std::string_view b
        ) const noexcept -> bool;
    };

    /// Header names compare case-insensitively but keep the spelling they
    /// were inserted with.
    using header_map =
        std::map<std::string, std::string, case_insensitive_less>;

    auto to_lower(std::string_view string) -> std::string;

    auto to_upper(std::string_view string) -> std::string;
}
