#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arbor {
    struct target {
        std::string_view path;
        std::string_view query;
    };

    /// Splits a request target into its path and query. Absolute URLs have
    /// their scheme and authority removed; any fragment is dropped.
    auto split_target(std::string_view target) -> arbor::target;

    /// Splits a path on '/' and drops empty components, so that '//a///b/'
    /// and 'a/b' produce the same segments.
    auto split_path(std::string_view path) -> std::vector<std::string>;

    auto percent_decode(std::string_view value, bool plus_as_space = false)
        -> std::string;

    /// Parses 'application/x-www-form-urlencoded' data, which is also the
    /// query string format. Pairs are returned in order of appearance.
    auto parse_urlencoded(std::string_view data)
        -> std::vector<std::pair<std::string, std::string>>;
}
