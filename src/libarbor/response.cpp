#include <arbor/media_type.hpp>
#include <arbor/response.hpp>

namespace {
    auto make(
        std::string&& body,
        arbor::response_init&& init,
        const arbor::media_type& type
    ) -> arbor::response {
        auto res = arbor::response {
            .status = init.status,
            .headers = std::move(init.headers),
            .body = std::move(body)
        };

        res.content_type(type);
        return res;
    }
}

namespace arbor {
    auto response::content_type() const -> std::optional<std::string_view> {
        return header("content-type");
    }

    auto response::content_type(const media_type& type) -> void {
        headers.emplace("content-type", type.str());
    }

    auto response::header(
        std::string_view name
    ) const -> std::optional<std::string_view> {
        const auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }

    auto response::header(std::string_view name, std::string_view value)
        -> void
    {
        headers.insert_or_assign(std::string(name), std::string(value));
    }

    auto json_response(const json& value, response_init init, int indent)
        -> response
    {
        return make(
            value.dump(indent, ' ', false, json::error_handler_t::replace),
            std::move(init),
            media::json()
        );
    }

    auto json_response(const json& value, int status) -> response {
        return json_response(value, response_init { .status = status });
    }

    auto text_response(std::string_view text, response_init init)
        -> response
    {
        return make(std::string(text), std::move(init), media::utf8_text());
    }

    auto text_response(std::string_view text, int status) -> response {
        return text_response(text, response_init { .status = status });
    }

    auto html_response(std::string_view html, response_init init)
        -> response
    {
        return make(std::string(html), std::move(init), media::html());
    }

    auto html_response(std::string_view html, int status) -> response {
        return html_response(html, response_init { .status = status });
    }

    auto redirect_response(std::string_view location, int status)
        -> response
    {
        auto res = empty_response(status);
        res.header("location", location);
        return res;
    }

    auto empty_response(int status) -> response {
        return response { .status = status };
    }
}
