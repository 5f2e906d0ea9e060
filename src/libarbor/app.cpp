#include <arbor/app.hpp>

#include <fmt/ranges.h>
#include <timber/timber>

namespace {
    auto validation_failure(
        std::string_view message,
        const arbor::json& issues
    ) -> arbor::response {
        auto body = arbor::json {
            {"error", "ValidationError"},
            {"message", message}
        };

        if (!issues.is_null()) body["issues"] = issues;

        return arbor::json_response(body, 400);
    }

    auto internal_server_error() -> arbor::response {
        return arbor::text_response("Internal Server Error", 500);
    }

    auto terminal(
        const arbor::handler& handler,
        arbor::context& ctx,
        int indent
    ) -> ext::task<arbor::outcome> {
        if (ctx.res) co_return *ctx.res;

        auto result = co_await handler(ctx);

        if (auto* const res = std::get_if<arbor::response>(&result)) {
            co_return std::move(*res);
        }

        co_return arbor::json_response(
            std::get<arbor::json>(result),
            arbor::response_init(),
            indent
        );
    }
}

namespace arbor {
    app::app(flat_tree&& tree, arbor::config config) : settings(config) {
        for (auto& record : tree.routes) {
            auto& methods = paths.insert(record.segments);

            auto chain = compose(
                record.stack,
                [handler = record.handler, indent = config.json_indent](
                    context& ctx,
                    next
                ) {
                    return terminal(handler, ctx, indent);
                }
            );

            const auto inserted = methods.insert(record.method, route_entry {
                .handler = std::move(record.handler),
                .validate = std::move(record.validate),
                .stack = std::move(record.stack),
                .chain = std::move(chain)
            });

            if (!inserted) {
                throw build_error(
                    "duplicate route {} /{}",
                    record.method,
                    fmt::join(record.segments, "/")
                );
            }

            ++count;

            TIMBER_TRACE(
                "Registered {} /{}",
                record.method,
                fmt::join(record.segments, "/")
            );
        }

        TIMBER_DEBUG(
            "Route table built with {} routes and {} middleware",
            count,
            tree.middleware_index.size()
        );
    }

    auto app::config() const noexcept -> const arbor::config& {
        return settings;
    }

    auto app::dispatch(
        const route_match& match,
        context& ctx
    ) const -> ext::task<response> {
        const auto& route = *match.route;
        const auto& req = ctx.request();

        if (const auto& error = ctx.body_error()) {
            TIMBER_DEBUG("{} {}: malformed body", req.method, req.target);
            co_return validation_failure(*error, nullptr);
        }

        if (route.validate) {
            auto failure = std::optional<response>();

            try {
                validate(*route.validate, ctx);
            }
            catch (const validation_error& ex) {
                failure = validation_failure(ex.what(), ex.issues());
            }
            catch (const std::exception& ex) {
                failure = validation_failure(ex.what(), nullptr);
            }
            catch (...) {
                failure = validation_failure("Validation failed", nullptr);
            }

            if (failure) {
                TIMBER_DEBUG(
                    "{} {}: validation failed: {}",
                    req.method,
                    req.target,
                    failure->body
                );
                co_return std::move(*failure);
            }
        }

        auto result = outcome();
        auto failure = std::optional<response>();

        try {
            result = co_await route.chain(ctx, next());
        }
        catch (const http_error& ex) {
            TIMBER_DEBUG(
                "{} {}: {} ({})",
                req.method,
                req.target,
                ex.status(),
                ex.what()
            );
            failure = ex.to_response();
        }
        catch (const protocol_error& ex) {
            TIMBER_ERROR(
                "{} {}: middleware protocol violation: {}",
                req.method,
                req.target,
                ex.what()
            );
            failure = internal_server_error();
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR(
                "{} {}: Status: 500 ({})",
                req.method,
                req.target,
                ex.what()
            );
            failure = internal_server_error();
        }
        catch (...) {
            TIMBER_ERROR("{} {}: Status: 500", req.method, req.target);
            failure = internal_server_error();
        }

        if (failure) co_return std::move(*failure);
        if (result) co_return std::move(*result);
        if (ctx.res) co_return std::move(*ctx.res);

        co_return empty_response(204);
    }

    auto app::handle(request req) const -> ext::task<response> {
        TIMBER_TRACE("{}", req);

        const auto method = to_upper(req.method);
        const auto path = split_target(req.target).path;

        auto match = this->match(method, path);

        if (!match) {
            TIMBER_DEBUG("{} {}: 404", method, path);
            co_return text_response("Not Found", 404);
        }

        if (!match->route) {
            const auto allowed = match->methods ?
                match->methods->allowed() : std::string();

            TIMBER_DEBUG("{} {}: 405 (allowed: {})", method, path, allowed);

            auto res = text_response("Method Not Allowed", 405);
            if (settings.allow_header && !allowed.empty()) {
                res.header("allow", allowed);
            }

            co_return res;
        }

        auto ctx = context(req);
        ctx.params = json(match->params);

        co_return co_await dispatch(*match, ctx);
    }

    auto app::match(
        std::string_view method,
        std::string_view path
    ) const -> std::optional<route_match> {
        auto result = paths.find(path);
        if (!result) return std::nullopt;

        return route_match {
            .route = result->value ?
                result->value->find(to_upper(method)) : nullptr,
            .methods = result->value,
            .params = std::move(result->params)
        };
    }

    auto app::size() const noexcept -> std::size_t {
        return count;
    }

    auto app::to_string() const -> std::string {
        return paths.to_string();
    }

    auto render(const element& root, arbor::config config) -> app {
        return app(flatten(root), config);
    }
}
