#pragma once

#include "context.hpp"

#include <ext/coroutine>
#include <functional>
#include <vector>

namespace arbor {
    /// The response a chain element produced, if any.
    using outcome = std::optional<response>;

    /// Runs the rest of the chain. May be invoked at most once.
    using next = std::function<ext::task<outcome>()>;

    using middleware = std::function<ext::task<outcome>(context&, next)>;

    /// Chains the middleware in order around the terminal element. The
    /// terminal receives the caller's continuation as its own. Invoking a
    /// continuation whose position the chain has already passed throws
    /// protocol_error.
    auto compose(std::vector<middleware> stack, middleware terminal)
        -> middleware;
}
