#pragma once

#include "compose.hpp"
#include "handler.hpp"
#include "validate.hpp"

#include <variant>

#define ARBOR_METHOD_FN(name, str) \
    template <typename F> \
    auto name(std::string path, F&& f) -> element { \
        return route(str, std::move(path), make_handler(std::forward<F>(f))); \
    } \
\
    template <typename F> \
    auto name(std::string path, validate_spec validate, F&& f) -> element { \
        return route( \
            str, \
            std::move(path), \
            make_handler(std::forward<F>(f)), \
            std::move(validate) \
        ); \
    }

namespace arbor {
    struct element;

    /// Prefixes the paths of its descendants.
    struct router_element {
        std::string path;
        std::vector<element> children;
    };

    /// Wraps its descendants' routes in a middleware. Without one it only
    /// groups its children.
    struct use_element {
        middleware handler;
        std::vector<element> children;
    };

    struct fragment_element {
        std::vector<element> children;
    };

    /// A method leaf. Leaves without a handler are not registered.
    struct route_element {
        std::string method;
        std::string path;
        arbor::handler handler;
        std::optional<validate_spec> validate;
    };

    struct element {
        std::variant<
            router_element,
            use_element,
            fragment_element,
            route_element
        > node;
    };

    auto router(std::string path, std::vector<element> children) -> element;

    auto use(middleware handler, std::vector<element> children) -> element;

    auto fragment(std::vector<element> children) -> element;

    auto route(
        std::string_view method,
        std::string path,
        handler handler,
        std::optional<validate_spec> validate = std::nullopt
    ) -> element;

    ARBOR_METHOD_FN(del, "DELETE")
    ARBOR_METHOD_FN(get, "GET")
    ARBOR_METHOD_FN(head, "HEAD")
    ARBOR_METHOD_FN(options, "OPTIONS")
    ARBOR_METHOD_FN(patch, "PATCH")
    ARBOR_METHOD_FN(post, "POST")
    ARBOR_METHOD_FN(put, "PUT")
}

#undef ARBOR_METHOD_FN
