#pragma once

#include "compose.hpp"

#include <chrono>

namespace arbor {
    using response_transform = std::function<response(response, context&)>;

    /// Passes the response produced further down the chain through 'fn'.
    /// Chains that produce no response are left alone.
    auto transform(response_transform fn) -> middleware;

    /// Continues the chain only if 'predicate' holds. Otherwise responds
    /// with 'fallback', or with a 403 problem when none is given.
    auto guard(
        std::function<bool(const context&)> predicate,
        std::optional<response> fallback = std::nullopt
    ) -> middleware;

    struct cors_options {
        /// Allowed origins. '*' allows any origin.
        std::vector<std::string> origins = {"*"};

        std::vector<std::string> methods = {
            "GET",
            "POST",
            "PUT",
            "DELETE",
            "PATCH",
            "OPTIONS"
        };

        std::vector<std::string> headers = {"Content-Type", "Authorization"};

        bool credentials = false;

        std::optional<std::chrono::seconds> max_age;
    };

    /// Answers preflight requests (OPTIONS with an
    /// 'Access-Control-Request-Method' header) with 204 and adds the
    /// Access-Control headers to every other response. Preflight requests
    /// only reach the middleware if an OPTIONS route exists for the path.
    auto cors(cors_options options = {}) -> middleware;

    struct rate_limit_options {
        /// Requests allowed per key in one window.
        unsigned int requests = 0;

        std::chrono::milliseconds window = std::chrono::milliseconds::zero();

        /// Selects the counter a request is charged to. Defaults to the
        /// 'X-Forwarded-For' header, then 'X-Real-IP', then "default".
        std::function<std::string(const context&)> key;

        /// Source of the current time. Defaults to the system clock.
        std::function<std::chrono::system_clock::time_point()> clock;
    };

    /// Fixed-window request limiting. Each middleware instance keeps its own
    /// counters. Requests over the limit receive a 429 problem with a
    /// 'Retry-After' header; others receive the 'X-RateLimit-*' headers.
    /// Throws std::invalid_argument if 'requests' or 'window' is zero.
    auto rate_limit(rate_limit_options options) -> middleware;
}
