#pragma once

#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace arbor {
    class media_type {
        struct parameter_entry {
            std::string name;
            std::string value;
        };

        std::string storage;
        std::size_t type_len = 0;
        std::vector<parameter_entry> parameters;
    public:
        media_type() = default;

        media_type(const char* str);

        media_type(std::string_view type);

        /// Compares type and subtype only; parameters are ignored.
        auto operator==(const media_type& other) const noexcept -> bool;

        auto essence() const noexcept -> std::string_view;

        auto parameter(
            std::string_view name
        ) const noexcept -> std::optional<std::string_view>;

        auto str() const -> std::string;

        auto subtype() const noexcept -> std::string_view;

        auto type() const noexcept -> std::string_view;
    };

    class invalid_media_type : public std::invalid_argument {
        std::string type;
    public:
        invalid_media_type(std::string_view type);

        auto invalid_type() const noexcept -> std::string_view;
    };

    namespace media {
        auto form_urlencoded() noexcept -> const media_type&;
        auto html() noexcept -> const media_type&;
        auto json() noexcept -> const media_type&;
        auto problem_json() noexcept -> const media_type&;
        auto utf8_text() noexcept -> const media_type&;
    }
}

namespace fmt {
    template <>
    struct formatter<arbor::media_type> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const arbor::media_type& media, FormatContext& ctx)
            const {
            return formatter<std::string_view>::format(media.str(), ctx);
        }
    };
}
