#include <arbor/context.hpp>
#include <arbor/media_type.hpp>
#include <arbor/url.hpp>

#include <timber/timber>

namespace {
    auto trim(std::string_view string) -> std::string_view {
        const auto first = string.find_first_not_of(" \t");
        if (first == std::string_view::npos) return {};

        const auto last = string.find_last_not_of(" \t");
        return string.substr(first, last - first + 1);
    }

    auto parse_cookies(std::string_view header) -> arbor::json {
        auto cookies = arbor::json::object();

        while (!header.empty()) {
            const auto semicolon = header.find(';');
            const auto cookie = trim(header.substr(0, semicolon));

            const auto equals = cookie.find('=');
            if (equals != std::string_view::npos && equals > 0) {
                cookies[std::string(cookie.substr(0, equals))] =
                    std::string(cookie.substr(equals + 1));
            }

            if (semicolon == std::string_view::npos) break;
            header.remove_prefix(semicolon + 1);
        }

        return cookies;
    }
}

namespace arbor {
    context::context(const arbor::request& request) : req(&request) {
        for (auto& [key, value] : parse_urlencoded(request.query())) {
            query[key] = std::move(value);
        }

        for (const auto& [name, value] : request.headers) {
            headers[to_lower(name)] = value;
        }

        if (const auto cookie = request.header("cookie")) {
            cookies = parse_cookies(*cookie);
        }

        const auto method = to_upper(request.method);
        if (method == "GET" || method == "HEAD") return;

        const auto content_type = request.header("content-type");
        if (!content_type) return;

        auto type = media_type();

        try {
            type = media_type(*content_type);
        }
        catch (const invalid_media_type& ex) {
            TIMBER_DEBUG("Request body left unparsed: {}", ex.what());
            return;
        }

        if (type.type() == "application" && type.subtype() == "json") {
            try {
                body = arbor::json::parse(request.body);
            }
            catch (const arbor::json::parse_error& ex) {
                TIMBER_DEBUG("Request body is not valid JSON: {}", ex.what());
                body = nullptr;
                error = ex.what();
            }
        }
        else if (type.type() == "text") body = request.body;
        else if (type == media::form_urlencoded()) {
            body = arbor::json::object();

            for (auto& [key, value] : parse_urlencoded(request.body)) {
                body[key] = std::move(value);
            }
        }
    }

    auto context::request() const noexcept -> const arbor::request& {
        return *req;
    }

    auto context::body_error() const noexcept
        -> const std::optional<std::string>&
    {
        return error;
    }

    auto context::has(std::string_view key) const -> bool {
        return data.contains(key);
    }

    auto context::set(std::string_view key, std::any value) -> void {
        data.insert_or_assign(std::string(key), std::move(value));
    }

    auto context::json(const arbor::json& value, int status) -> response {
        return json(value, response_init {.status = status});
    }

    auto context::json(const arbor::json& value, response_init init)
        -> response
    {
        res = json_response(value, std::move(init));
        return *res;
    }

    auto context::text(std::string_view value, int status) -> response {
        return text(value, response_init {.status = status});
    }

    auto context::text(std::string_view value, response_init init)
        -> response
    {
        res = text_response(value, std::move(init));
        return *res;
    }

    auto context::html(std::string_view value, int status) -> response {
        return html(value, response_init {.status = status});
    }

    auto context::html(std::string_view value, response_init init)
        -> response
    {
        res = html_response(value, std::move(init));
        return *res;
    }

    auto context::redirect(std::string_view location, int status)
        -> response
    {
        res = redirect_response(location, status);
        return *res;
    }
}
