#pragma once

#include "flatten.hpp"
#include "method_table.hpp"
#include "trie.hpp"

namespace arbor {
    struct config {
        /// Send an 'allow' header listing the path's methods with a 405.
        bool allow_header = true;

        /// Indentation for JSON produced from handler return values. A
        /// negative value produces compact output.
        int json_indent = -1;
    };

    struct route_match {
        /// The route registered for the requested method, or null when the
        /// path exists but the method is not allowed.
        const route_entry* route;

        /// Null when no route ends at the path.
        const method_table* methods;
        params_map params;
    };

    /// A bound route table. Immutable once constructed, so one instance may
    /// serve any number of concurrent requests. It must outlive the tasks
    /// returned by handle().
    class app {
        node<method_table> paths;
        arbor::config settings;
        std::size_t count = 0;

        auto dispatch(
            const route_match& match,
            context& ctx
        ) const -> ext::task<response>;
    public:
        app(flat_tree&& tree, arbor::config config = {});

        app(const app&) = delete;

        app(app&&) = default;

        auto operator=(const app&) -> app& = delete;

        auto operator=(app&&) -> app& = default;

        auto config() const noexcept -> const arbor::config&;

        auto handle(request req) const -> ext::task<response>;

        auto match(
            std::string_view method,
            std::string_view path
        ) const -> std::optional<route_match>;

        auto size() const noexcept -> std::size_t;

        auto to_string() const -> std::string;
    };

    /// Flattens the tree and builds its route table. Throws build_error if
    /// the routes conflict.
    auto render(const element& root, arbor::config config = {}) -> app;
}
