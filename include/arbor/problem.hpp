#pragma once

#include "response.hpp"

#include <stdexcept>

namespace arbor {
    /// An error that knows which response it should produce. The dispatcher
    /// sends that response instead of a generic 500.
    struct http_error : virtual std::runtime_error {
        http_error() : runtime_error("http error") {}

        virtual ~http_error() = default;

        virtual auto status() const noexcept -> int = 0;

        virtual auto to_response() const -> response = 0;
    };

    /// RFC 7807 Problem Details fields.
    struct problem {
        std::optional<std::string> type;
        std::optional<std::string> title;
        std::optional<std::string> detail;
        std::optional<std::string> instance;
        header_map headers;
    };

    auto status_title(int status) -> std::string;

    /// Builds an 'application/problem+json' response. The type defaults to
    /// 'about:blank' and the title to the standard reason phrase.
    auto problem_json(int status, problem details = {}) -> response;

    class http_exception : public http_error {
        int code;
        problem details;
        std::optional<response> res;
    public:
        http_exception(int status, problem details = {});

        http_exception(int status, std::string_view detail);

        auto detail() const noexcept -> const std::optional<std::string>&;

        auto status() const noexcept -> int override;

        auto title() const -> std::string;

        auto to_response() const -> response override;

        static auto bad_request(problem details = {}) -> http_exception;
        static auto unauthorized(problem details = {}) -> http_exception;
        static auto forbidden(problem details = {}) -> http_exception;
        static auto not_found(problem details = {}) -> http_exception;
        static auto method_not_allowed(problem details = {}) -> http_exception;
        static auto conflict(problem details = {}) -> http_exception;
        static auto unprocessable_entity(problem details = {})
            -> http_exception;
        static auto too_many_requests(problem details = {}) -> http_exception;
        static auto internal_server_error(problem details = {})
            -> http_exception;

        /// An exception whose response is sent verbatim.
        static auto from_response(response res) -> http_exception;
    };
}
