#include "test.hpp"

using namespace std::literals;

namespace {
    using log_type = std::vector<std::string>;

    auto wrap(log_type& log, std::string name) -> arbor::middleware {
        return [&log, name](
            arbor::context& ctx,
            arbor::next next
        ) -> ext::task<arbor::outcome> {
            log.push_back("enter:" + name);
            auto result = co_await next();
            log.push_back("exit:" + name);
            co_return result;
        };
    }

    auto respond(log_type& log, int status) -> arbor::middleware {
        return [&log, status](
            arbor::context& ctx,
            arbor::next next
        ) -> ext::task<arbor::outcome> {
            log.push_back("terminal");
            co_return arbor::text_response("done", status);
        };
    }

    class Compose : public testing::Test {
    protected:
        arbor::request req;
        arbor::context ctx;
        log_type log;

        Compose() : ctx(req) {}

        auto run(
            const arbor::middleware& chain,
            arbor::next outer = {}
        ) -> arbor::outcome {
            return arbor::test::wait([&] {
                return chain(ctx, std::move(outer));
            });
        }
    };
}

TEST_F(Compose, OnionOrder) {
    const auto chain = arbor::compose(
        {wrap(log, "outer"), wrap(log, "inner")},
        respond(log, 200)
    );

    const auto result = run(chain);

    ASSERT_TRUE(result);
    EXPECT_EQ(200, result->status);
    EXPECT_EQ(
        (log_type {
            "enter:outer",
            "enter:inner",
            "terminal",
            "exit:inner",
            "exit:outer"
        }),
        log
    );
}

TEST_F(Compose, EmptyStackRunsTerminal) {
    const auto chain = arbor::compose({}, respond(log, 201));

    const auto result = run(chain);

    ASSERT_TRUE(result);
    EXPECT_EQ(201, result->status);
    EXPECT_EQ(log_type {"terminal"}, log);
}

TEST_F(Compose, ShortCircuit) {
    auto custom = arbor::text_response("stop", 418);
    custom.header("x-custom", "yes");

    const auto blocker = [&](
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        log.push_back("blocker");
        co_return custom;
    };

    const auto chain = arbor::compose(
        {wrap(log, "outer"), blocker, wrap(log, "never")},
        respond(log, 200)
    );

    const auto result = run(chain);

    ASSERT_TRUE(result);
    EXPECT_EQ(418, result->status);
    EXPECT_EQ("stop"sv, result->body);
    EXPECT_EQ("yes"sv, result->header("x-custom"));
    EXPECT_EQ(custom.headers, result->headers);
    EXPECT_EQ(
        (log_type {"enter:outer", "blocker", "exit:outer"}),
        log
    );
}

TEST_F(Compose, NextCalledTwiceFails) {
    auto downstream = 0;

    const auto twice = [](
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        co_await next();
        co_return co_await next();
    };

    const auto counter = [&downstream](
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        ++downstream;
        co_return arbor::empty_response(200);
    };

    const auto chain = arbor::compose({twice}, counter);

    EXPECT_THROW(run(chain), arbor::protocol_error);
    EXPECT_EQ(1, downstream);
}

TEST_F(Compose, NestedNextReuseFails) {
    auto saved = arbor::next();

    const auto keep = [&saved](
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        saved = next;
        co_return co_await next();
    };

    const auto reuse = [&saved](
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        co_await next();
        co_return co_await saved();
    };

    const auto chain = arbor::compose({keep, reuse}, respond(log, 200));

    EXPECT_THROW(run(chain), arbor::protocol_error);
    EXPECT_EQ(log_type {"terminal"}, log);
}

TEST_F(Compose, TerminalReceivesOuterNext) {
    const auto passthrough = [](
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        co_return co_await next();
    };

    const auto inner = arbor::compose({wrap(log, "inner")}, passthrough);
    const auto outer = arbor::compose(
        {wrap(log, "outer"), inner},
        respond(log, 202)
    );

    const auto result = run(outer);

    ASSERT_TRUE(result);
    EXPECT_EQ(202, result->status);
    EXPECT_EQ(
        (log_type {
            "enter:outer",
            "enter:inner",
            "terminal",
            "exit:inner",
            "exit:outer"
        }),
        log
    );
}

TEST_F(Compose, ChainWithoutResponse) {
    const auto chain = arbor::compose({wrap(log, "only")}, nullptr);

    const auto result = run(chain);

    EXPECT_FALSE(result);
    EXPECT_EQ((log_type {"enter:only", "exit:only"}), log);
}

TEST_F(Compose, OuterNextIsCalledPastTerminal) {
    auto called = false;

    const auto chain = arbor::compose({}, [](
        arbor::context& ctx,
        arbor::next next
    ) -> ext::task<arbor::outcome> {
        co_return co_await next();
    });

    const auto result = run(chain, [&called]() -> ext::task<arbor::outcome> {
        called = true;
        co_return arbor::empty_response(204);
    });

    EXPECT_TRUE(called);
    ASSERT_TRUE(result);
    EXPECT_EQ(204, result->status);
}

TEST_F(Compose, ExceptionsPropagate) {
    const auto chain = arbor::compose(
        {wrap(log, "outer")},
        [](arbor::context&, arbor::next) -> ext::task<arbor::outcome> {
            throw std::runtime_error("handler failed");
            co_return std::nullopt;
        }
    );

    EXPECT_THROW(run(chain), std::runtime_error);
    EXPECT_EQ(log_type {"enter:outer"}, log);
}

TEST_F(Compose, ChainIsReusable) {
    const auto chain = arbor::compose({wrap(log, "a")}, respond(log, 200));

    EXPECT_TRUE(run(chain));
    EXPECT_TRUE(run(chain));
    EXPECT_EQ(6u, log.size());
}
