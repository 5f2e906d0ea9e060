#pragma once

#include "tree.hpp"

namespace arbor {
    struct route_record {
        std::string method;
        std::vector<std::string> segments;
        arbor::handler handler;
        std::optional<validate_spec> validate;

        /// Enclosing middleware, outermost first.
        std::vector<middleware> stack;
    };

    /// Where a middleware was declared. Kept for diagnostics only.
    struct use_record {
        std::vector<std::string> prefix;
        middleware handler;
    };

    struct flat_tree {
        std::vector<route_record> routes;
        std::vector<use_record> middleware_index;
    };

    /// Walks the tree depth-first, left to right, accumulating path
    /// prefixes and middleware for each route leaf.
    auto flatten(const element& root) -> flat_tree;
}
