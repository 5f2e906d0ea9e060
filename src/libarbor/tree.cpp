#include <arbor/tree.hpp>

namespace arbor {
    auto router(std::string path, std::vector<element> children) -> element {
        return {router_element {
            .path = std::move(path),
            .children = std::move(children)
        }};
    }

    auto use(middleware handler, std::vector<element> children) -> element {
        return {use_element {
            .handler = std::move(handler),
            .children = std::move(children)
        }};
    }

    auto fragment(std::vector<element> children) -> element {
        return {fragment_element {.children = std::move(children)}};
    }

    auto route(
        std::string_view method,
        std::string path,
        handler handler,
        std::optional<validate_spec> validate
    ) -> element {
        return {route_element {
            .method = to_upper(method),
            .path = std::move(path),
            .handler = std::move(handler),
            .validate = std::move(validate)
        }};
    }
}
