#pragma once

#include "headers.hpp"
#include "json.hpp"

#include <optional>

namespace arbor {
    class media_type;

    struct response {
        int status = 200;
        header_map headers;
        std::string body;

        auto content_type() const -> std::optional<std::string_view>;

        /// Sets the content type unless one is already present.
        auto content_type(const media_type& type) -> void;

        auto header(std::string_view name) const
            -> std::optional<std::string_view>;

        auto header(std::string_view name, std::string_view value) -> void;
    };

    struct response_init {
        int status = 200;
        header_map headers;
    };

    auto json_response(
        const json& value,
        response_init init = {},
        int indent = -1
    ) -> response;

    auto json_response(const json& value, int status) -> response;

    auto text_response(
        std::string_view text,
        response_init init = {}
    ) -> response;

    auto text_response(std::string_view text, int status) -> response;

    auto html_response(
        std::string_view html,
        response_init init = {}
    ) -> response;

    auto html_response(std::string_view html, int status) -> response;

    auto redirect_response(std::string_view location, int status = 302)
        -> response;

    /// An empty response with no content type.
    auto empty_response(int status) -> response;
}
