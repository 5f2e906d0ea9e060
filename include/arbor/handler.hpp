#pragma once

#include "context.hpp"

#include <ext/coroutine>
#include <functional>
#include <variant>

namespace arbor {
    /// What a route handler produces: a JSON value to be serialized with
    /// status 200, or a complete response. Defaults to JSON null.
    using reply = std::variant<json, response>;

    using handler = std::function<ext::task<reply>(context&)>;

    namespace detail {
        template <typename T>
        struct is_task : std::false_type {};

        template <typename T>
        struct is_task<ext::task<T>> : std::true_type {
            using value_type = T;
        };

        template <typename R>
        auto to_reply(R&& result) -> reply {
            using type = std::remove_cvref_t<R>;

            if constexpr (std::same_as<type, reply>) {
                return std::forward<R>(result);
            }
            else if constexpr (std::same_as<type, response>) {
                return reply(
                    std::in_place_type<response>,
                    std::forward<R>(result)
                );
            }
            else {
                return reply(std::in_place_type<json>, std::forward<R>(result));
            }
        }

        template <typename F>
        auto invoke(const F& fn, context& ctx) -> ext::task<reply> {
            using result = std::invoke_result_t<const F&, context&>;

            if constexpr (is_task<result>::value) {
                using value_type = typename is_task<result>::value_type;

                if constexpr (std::is_void_v<value_type>) {
                    co_await fn(ctx);
                    co_return reply();
                }
                else co_return to_reply(co_await fn(ctx));
            }
            else if constexpr (std::is_void_v<result>) {
                fn(ctx);
                co_return reply();
            }
            else co_return to_reply(fn(ctx));
        }
    }

    /// Adapts a callable taking a context into a handler. The callable may
    /// return nothing, a response, anything convertible to JSON, or a task
    /// producing one of those.
    template <typename F>
    requires std::invocable<const std::decay_t<F>&, context&>
    auto make_handler(F&& f) -> handler {
        return [fn = std::forward<F>(f)](context& ctx) -> ext::task<reply> {
            return detail::invoke(fn, ctx);
        };
    }
}
