#include <arbor/headers.hpp>
#include <arbor/media_type.hpp>

#include <fmt/format.h>

namespace {
    auto is_space(char c) noexcept -> bool {
        return c == ' ' || c == '\t';
    }

    auto trim(std::string_view string) -> std::string_view {
        while (!string.empty() && is_space(string.front())) {
            string.remove_prefix(1);
        }

        while (!string.empty() && is_space(string.back())) {
            string.remove_suffix(1);
        }

        return string;
    }

    auto unquote(std::string_view value) -> std::string_view {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            return value.substr(1, value.size() - 2);
        }

        return value;
    }
}

namespace arbor {
    media_type::media_type(const char* str) :
        media_type(std::string_view(str))
    {}

    media_type::media_type(std::string_view type) {
        const auto semicolon = type.find(';');
        const auto essence = trim(type.substr(0, semicolon));

        const auto slash = essence.find('/');
        if (
            slash == std::string_view::npos ||
            slash == 0 ||
            slash == essence.size() - 1 ||
            essence.find('/', slash + 1) != std::string_view::npos
        ) {
            throw invalid_media_type(type);
        }

        storage = to_lower(essence);
        type_len = slash;

        if (semicolon == std::string_view::npos) return;

        auto rest = type.substr(semicolon + 1);

        while (!rest.empty()) {
            const auto end = rest.find(';');
            const auto param = trim(rest.substr(0, end));
            rest = end == std::string_view::npos ?
                std::string_view() : rest.substr(end + 1);

            if (param.empty()) continue;

            const auto equals = param.find('=');
            if (equals == std::string_view::npos || equals == 0) {
                throw invalid_media_type(type);
            }

            parameters.push_back({
                .name = to_lower(trim(param.substr(0, equals))),
                .value = std::string(unquote(trim(param.substr(equals + 1))))
            });
        }
    }

    auto media_type::operator==(
        const media_type& other
    ) const noexcept -> bool {
        return storage == other.storage;
    }

    auto media_type::essence() const noexcept -> std::string_view {
        return storage;
    }

    auto media_type::parameter(
        std::string_view name
    ) const noexcept -> std::optional<std::string_view> {
        for (const auto& entry : parameters) {
            if (!case_insensitive_less()(entry.name, name) &&
                !case_insensitive_less()(name, entry.name)) {
                return entry.value;
            }
        }

        return std::nullopt;
    }

    auto media_type::str() const -> std::string {
        auto result = storage;

        for (const auto& entry : parameters) {
            fmt::format_to(
                std::back_inserter(result),
                "; {}={}",
                entry.name,
                entry.value
            );
        }

        return result;
    }

    auto media_type::subtype() const noexcept -> std::string_view {
        return std::string_view(storage).substr(type_len + 1);
    }

    auto media_type::type() const noexcept -> std::string_view {
        return std::string_view(storage).substr(0, type_len);
    }

    invalid_media_type::invalid_media_type(std::string_view type) :
        invalid_argument(fmt::format("invalid media type: '{}'", type)),
        type(type)
    {}

    auto invalid_media_type::invalid_type() const noexcept -> std::string_view {
        return type;
    }

    namespace media {
        auto form_urlencoded() noexcept -> const media_type& {
            static const media_type type = "application/x-www-form-urlencoded";
            return type;
        }

        auto html() noexcept -> const media_type& {
            static const media_type type = "text/html; charset=utf-8";
            return type;
        }

        auto json() noexcept -> const media_type& {
            static const media_type type = "application/json; charset=utf-8";
            return type;
        }

        auto problem_json() noexcept -> const media_type& {
            static const media_type type = "application/problem+json";
            return type;
        }

        auto utf8_text() noexcept -> const media_type& {
            static const media_type type = "text/plain; charset=utf-8";
            return type;
        }
    }
}
