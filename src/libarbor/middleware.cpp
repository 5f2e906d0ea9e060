#include <arbor/middleware.hpp>

#include <algorithm>
#include <fmt/ranges.h>
#include <map>
#include <memory>
#include <mutex>
#include <timber/timber>

namespace {
    auto run_transform(
        arbor::response_transform fn,
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        auto result = co_await next();
        if (!result) co_return result;

        co_return fn(std::move(*result), ctx);
    }

    auto run_guard(
        std::function<bool(const arbor::context&)> predicate,
        std::optional<arbor::response> fallback,
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        if (predicate(ctx)) co_return co_await next();

        const auto& req = ctx.request();
        TIMBER_DEBUG("{} {}: rejected by guard", req.method, req.target);

        if (fallback) co_return *fallback;
        co_return arbor::problem_json(403);
    }

    auto allowed_origin(
        const arbor::cors_options& options,
        std::optional<std::string_view> origin
    ) -> std::string {
        const auto& origins = options.origins;

        const auto any = std::find(origins.begin(), origins.end(), "*");
        if (any != origins.end()) return "*";

        if (
            origin &&
            std::find(origins.begin(), origins.end(), *origin) !=
                origins.end()
        ) {
            return std::string(*origin);
        }

        return origins.empty() ? "*" : origins.front();
    }

    auto run_cors(
        std::shared_ptr<const arbor::cors_options> options,
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        const auto& req = ctx.request();
        const auto origin = allowed_origin(*options, req.header("origin"));

        if (
            arbor::to_upper(req.method) == "OPTIONS" &&
            req.header("access-control-request-method")
        ) {
            auto res = arbor::empty_response(204);

            res.header("access-control-allow-origin", origin);
            res.header(
                "access-control-allow-methods",
                fmt::format("{}", fmt::join(options->methods, ", "))
            );
            res.header(
                "access-control-allow-headers",
                fmt::format("{}", fmt::join(options->headers, ", "))
            );

            if (options->credentials) {
                res.header("access-control-allow-credentials", "true");
            }

            if (options->max_age) {
                res.header(
                    "access-control-max-age",
                    fmt::format("{}", options->max_age->count())
                );
            }

            co_return res;
        }

        auto result = co_await next();
        if (!result) co_return result;

        result->header("access-control-allow-origin", origin);

        if (options->credentials) {
            result->header("access-control-allow-credentials", "true");
        }

        if (!options->headers.empty()) {
            result->header(
                "access-control-expose-headers",
                fmt::format("{}", fmt::join(options->headers, ", "))
            );
        }

        co_return result;
    }

    using wall_clock = std::chrono::system_clock;

    auto default_key(const arbor::context& ctx) -> std::string {
        const auto& req = ctx.request();

        if (const auto forwarded = req.header("x-forwarded-for")) {
            return std::string(*forwarded);
        }

        if (const auto real_ip = req.header("x-real-ip")) {
            return std::string(*real_ip);
        }

        return "default";
    }

    auto epoch_seconds(wall_clock::time_point time) -> long long {
        return std::chrono::duration_cast<std::chrono::seconds>(
            time.time_since_epoch()
        ).count();
    }

    /// Request counters for one rate_limit middleware.
    class limiter {
        struct window {
            unsigned int count;
            wall_clock::time_point reset;
        };

        std::mutex mutex;
        std::map<std::string, window> windows;
    public:
        const arbor::rate_limit_options options;

        explicit limiter(arbor::rate_limit_options&& options) :
            options(std::move(options))
        {}

        /// Charges one request to 'key'. Returns the window state after
        /// the charge, or nullopt if the limit was already reached, in
        /// which case 'reset' receives the end of the current window.
        auto charge(
            const std::string& key,
            wall_clock::time_point now,
            wall_clock::time_point& reset
        ) -> std::optional<unsigned int> {
            const auto lock = std::lock_guard(mutex);

            auto it = windows.find(key);

            if (it == windows.end() || now > it->second.reset) {
                reset = now + options.window;
                windows.insert_or_assign(key, window {1, reset});
                return 1;
            }

            reset = it->second.reset;

            if (it->second.count >= options.requests) return std::nullopt;
            return ++it->second.count;
        }
    };

    auto run_rate_limit(
        std::shared_ptr<limiter> limits,
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        const auto& options = limits->options;

        const auto key = options.key ? options.key(ctx) : default_key(ctx);
        const auto now = options.clock ? options.clock() : wall_clock::now();
        auto reset = wall_clock::time_point();

        const auto count = limits->charge(key, now, reset);
        const auto limit = fmt::format("{}", options.requests);
        const auto reset_header = fmt::format("{}", epoch_seconds(reset));

        if (!count) {
            const auto retry_after = std::chrono::ceil<std::chrono::seconds>(
                reset - now
            ).count();

            TIMBER_DEBUG(
                "Rate limit exceeded for '{}': retry in {}s",
                key,
                retry_after
            );

            co_return arbor::problem_json(429, {
                .title = "Rate limit exceeded",
                .detail = fmt::format(
                    "Too many requests. Try again in {} seconds.",
                    retry_after
                ),
                .headers = {
                    {"retry-after", fmt::format("{}", retry_after)},
                    {"x-ratelimit-limit", limit},
                    {"x-ratelimit-remaining", "0"},
                    {"x-ratelimit-reset", reset_header}
                }
            });
        }

        auto result = co_await next();
        if (!result) co_return result;

        result->header("x-ratelimit-limit", limit);
        result->header(
            "x-ratelimit-remaining",
            fmt::format("{}", options.requests - *count)
        );
        result->header("x-ratelimit-reset", reset_header);

        co_return result;
    }
}

namespace arbor {
    auto transform(response_transform fn) -> middleware {
        return [fn = std::move(fn)](context& ctx, next next) {
            return run_transform(fn, ctx, std::move(next));
        };
    }

    auto guard(
        std::function<bool(const context&)> predicate,
        std::optional<response> fallback
    ) -> middleware {
        return [
            predicate = std::move(predicate),
            fallback = std::move(fallback)
        ](context& ctx, next next) {
            return run_guard(predicate, fallback, ctx, std::move(next));
        };
    }

    auto cors(cors_options options) -> middleware {
        const auto shared =
            std::make_shared<const cors_options>(std::move(options));

        return [shared](context& ctx, next next) {
            return run_cors(shared, ctx, std::move(next));
        };
    }

    auto rate_limit(rate_limit_options options) -> middleware {
        if (options.requests == 0) {
            throw std::invalid_argument("rate limit must allow a request");
        }

        if (options.window <= std::chrono::milliseconds::zero()) {
            throw std::invalid_argument("rate limit window must be positive");
        }

        const auto limits = std::make_shared<limiter>(std::move(options));

        return [limits](context& ctx, next next) {
            return run_rate_limit(limits, ctx, std::move(next));
        };
    }
}
