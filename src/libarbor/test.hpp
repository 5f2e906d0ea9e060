#pragma once

#include <arbor/arbor>

#include <gtest/gtest.h>

namespace arbor::test {
    /// Drives a task produced by 'f' to completion on the calling thread.
    template <typename F>
    auto wait(F&& f) {
        using task = std::invoke_result_t<F&>;
        using value_type = typename detail::is_task<task>::value_type;

        const auto join = [&]() -> ext::jtask<value_type> {
            co_return co_await f();
        };

        auto joined = join();
        return std::move(joined).result();
    }

    inline auto send(const app& app, request req) -> response {
        return wait([&] { return app.handle(std::move(req)); });
    }

    inline auto send(
        const app& app,
        std::string method,
        std::string target
    ) -> response {
        return send(app, request {
            .method = std::move(method),
            .target = std::move(target)
        });
    }

    inline auto body(const response& res) -> json {
        return json::parse(res.body);
    }
}
