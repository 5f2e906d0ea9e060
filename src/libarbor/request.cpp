#include <arbor/request.hpp>
#include <arbor/url.hpp>

namespace arbor {
    auto request::header(
        std::string_view name
    ) const -> std::optional<std::string_view> {
        const auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }

    auto request::path() const -> std::string_view {
        return split_target(target).path;
    }

    auto request::query() const -> std::string_view {
        return split_target(target).query;
    }
}
