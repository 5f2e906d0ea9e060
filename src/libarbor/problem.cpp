#include <arbor/media_type.hpp>
#include <arbor/problem.hpp>

#include <fmt/format.h>

namespace {
    auto message(int status, const arbor::problem& details) -> std::string {
        if (details.detail) return *details.detail;
        if (details.title) return *details.title;
        return arbor::status_title(status);
    }
}

namespace arbor {
    auto status_title(int status) -> std::string {
        switch (status) {
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 409: return "Conflict";
            case 422: return "Unprocessable Entity";
            case 429: return "Too Many Requests";
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            default: return fmt::format("HTTP {}", status);
        }
    }

    auto problem_json(int status, problem details) -> response {
        auto body = json {
            {"type", details.type.value_or("about:blank")},
            {"title", details.title.value_or(status_title(status))},
            {"status", status}
        };

        if (details.detail) body["detail"] = *details.detail;
        if (details.instance) body["instance"] = *details.instance;

        auto res = response {
            .status = status,
            .headers = std::move(details.headers),
            .body = body.dump(
                -1,
                ' ',
                false,
                json::error_handler_t::replace
            )
        };

        res.content_type(media::problem_json());
        return res;
    }

    http_exception::http_exception(int status, problem details) :
        runtime_error(message(status, details)),
        code(status),
        details(std::move(details))
    {}

    http_exception::http_exception(int status, std::string_view detail) :
        http_exception(status, problem {.detail = std::string(detail)})
    {}

    auto http_exception::detail() const noexcept
        -> const std::optional<std::string>&
    {
        return details.detail;
    }

    auto http_exception::status() const noexcept -> int {
        return code;
    }

    auto http_exception::title() const -> std::string {
        return details.title.value_or(status_title(code));
    }

    auto http_exception::to_response() const -> response {
        if (res) return *res;
        return problem_json(code, details);
    }

    auto http_exception::bad_request(problem details) -> http_exception {
        return {400, std::move(details)};
    }

    auto http_exception::unauthorized(problem details) -> http_exception {
        return {401, std::move(details)};
    }

    auto http_exception::forbidden(problem details) -> http_exception {
        return {403, std::move(details)};
    }

    auto http_exception::not_found(problem details) -> http_exception {
        return {404, std::move(details)};
    }

    auto http_exception::method_not_allowed(problem details)
        -> http_exception
    {
        return {405, std::move(details)};
    }

    auto http_exception::conflict(problem details) -> http_exception {
        return {409, std::move(details)};
    }

    auto http_exception::unprocessable_entity(problem details)
        -> http_exception
    {
        return {422, std::move(details)};
    }

    auto http_exception::too_many_requests(problem details)
        -> http_exception
    {
        return {429, std::move(details)};
    }

    auto http_exception::internal_server_error(problem details)
        -> http_exception
    {
        return {500, std::move(details)};
    }

    auto http_exception::from_response(response res) -> http_exception {
        auto ex = http_exception(res.status > 0 ? res.status : 500);
        ex.res = std::move(res);
        return ex;
    }
}
