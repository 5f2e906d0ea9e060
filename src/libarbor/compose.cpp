#include <arbor/compose.hpp>
#include <arbor/error.hpp>

#include <cstddef>
#include <memory>
#include <timber/timber>

namespace {
    struct chain {
        std::vector<arbor::middleware> stack;
        arbor::middleware terminal;
    };

    auto finish() -> ext::task<arbor::outcome> {
        co_return arbor::outcome();
    }

    class cursor {
        const chain& elements;
        arbor::context& ctx;
        arbor::next outer;
        std::ptrdiff_t index = -1;

        auto continuation(std::size_t i) -> arbor::next {
            return [this, i] { return dispatch(i + 1); };
        }
    public:
        cursor(
            const chain& elements,
            arbor::context& ctx,
            arbor::next&& outer
        ) :
            elements(elements),
            ctx(ctx),
            outer(std::move(outer))
        {}

        auto dispatch(std::size_t i) -> ext::task<arbor::outcome> {
            const auto position = static_cast<std::ptrdiff_t>(i);

            if (position <= index) {
                TIMBER_ERROR(
                    "next() called multiple times: position {} already "
                    "passed (reached {})",
                    position,
                    index
                );

                throw arbor::protocol_error("next() called multiple times");
            }

            index = position;

            const auto size = elements.stack.size();

            if (i < size) return elements.stack[i](ctx, continuation(i));
            if (i == size && elements.terminal) {
                return elements.terminal(ctx, continuation(i));
            }
            if (outer) return outer();

            return finish();
        }
    };

    auto run(
        std::shared_ptr<const chain> elements,
        arbor::context& ctx,
        arbor::next outer
    ) -> ext::task<arbor::outcome> {
        auto position = cursor(*elements, ctx, std::move(outer));
        co_return co_await position.dispatch(0);
    }
}

namespace arbor {
    auto compose(std::vector<middleware> stack, middleware terminal)
        -> middleware
    {
        const auto elements = std::make_shared<const chain>(chain {
            .stack = std::move(stack),
            .terminal = std::move(terminal)
        });

        return [elements](context& ctx, next outer) {
            return run(elements, ctx, std::move(outer));
        };
    }
}
