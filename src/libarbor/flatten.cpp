#include <arbor/flatten.hpp>
#include <arbor/url.hpp>

#include <fmt/ranges.h>
#include <timber/timber>

namespace {
    auto concat(
        const std::vector<std::string>& prefix,
        std::string_view path
    ) -> std::vector<std::string> {
        auto result = prefix;

        for (auto& segment : arbor::split_path(path)) {
            result.push_back(std::move(segment));
        }

        return result;
    }

    class walker {
        arbor::flat_tree& result;
        const std::vector<std::string>& prefix;
        const std::vector<arbor::middleware>& stack;

        auto descend(
            const std::vector<arbor::element>& children,
            const std::vector<std::string>& prefix,
            const std::vector<arbor::middleware>& stack
        ) const -> void {
            for (const auto& child : children) {
                std::visit(walker(result, prefix, stack), child.node);
            }
        }
    public:
        walker(
            arbor::flat_tree& result,
            const std::vector<std::string>& prefix,
            const std::vector<arbor::middleware>& stack
        ) :
            result(result),
            prefix(prefix),
            stack(stack)
        {}

        auto operator()(const arbor::router_element& router) const -> void {
            descend(router.children, concat(prefix, router.path), stack);
        }

        auto operator()(const arbor::use_element& use) const -> void {
            if (!use.handler) {
                descend(use.children, prefix, stack);
                return;
            }

            result.middleware_index.push_back({
                .prefix = prefix,
                .handler = use.handler
            });

            auto inner = stack;
            inner.push_back(use.handler);

            descend(use.children, prefix, inner);
        }

        auto operator()(const arbor::fragment_element& fragment) const
            -> void
        {
            descend(fragment.children, prefix, stack);
        }

        auto operator()(const arbor::route_element& route) const -> void {
            if (!route.handler) {
                TIMBER_DEBUG(
                    "Skipping {} /{}{} without a handler",
                    route.method,
                    fmt::join(prefix, "/"),
                    route.path
                );
                return;
            }

            result.routes.push_back({
                .method = route.method,
                .segments = concat(prefix, route.path),
                .handler = route.handler,
                .validate = route.validate,
                .stack = stack
            });
        }
    };
}

namespace arbor {
    auto flatten(const element& root) -> flat_tree {
        auto result = flat_tree();

        const auto prefix = std::vector<std::string>();
        const auto stack = std::vector<middleware>();

        std::visit(walker(result, prefix, stack), root.node);

        return result;
    }
}
