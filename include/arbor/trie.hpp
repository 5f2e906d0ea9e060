#pragma once

#include "error.hpp"
#include "url.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbor {
    using params_map = std::map<std::string, std::string>;

    template <typename T>
    struct match {
        /// Null when the path ends on a node that no route ends at.
        const T* value;
        params_map params;
    };

    /// A path segment trie. Each node has literal children keyed by their
    /// exact text, at most one parameter child (':name') and at most one
    /// wildcard child ('*' or '*name'), which must end its route.
    template <typename T>
    class node {
        std::map<std::string, std::unique_ptr<node>, std::less<>> literals;
        std::unique_ptr<node> param;
        std::string param_name;
        std::unique_ptr<node> wildcard;
        std::string wildcard_name;
        std::optional<T> value;

        static auto join(
            const std::vector<std::string>& segments,
            std::size_t first
        ) -> std::string {
            auto result = std::string();

            for (auto i = first; i < segments.size(); ++i) {
                if (i != first) result.push_back('/');
                result.append(segments[i]);
            }

            return result;
        }

        /// Literal children are tried first, then the parameter child, then
        /// the wildcard child. A branch fails when it runs out of children
        /// before consuming every segment; its captures are then undone and
        /// the next branch is tried. Any node reached with no segments left
        /// ends the walk, whether or not a route ends there.
        auto find(
            const std::vector<std::string>& segments,
            std::size_t i,
            params_map& params
        ) const -> const node* {
            if (i == segments.size()) return this;

            const auto& segment = segments[i];

            const auto literal = literals.find(segment);
            if (literal != literals.end()) {
                if (const auto* const result =
                    literal->second->find(segments, i + 1, params)
                ) return result;
            }

            if (param) {
                params.insert_or_assign(param_name, segment);

                if (const auto* const result =
                    param->find(segments, i + 1, params)
                ) return result;

                params.erase(param_name);
            }

            if (wildcard) {
                params.insert_or_assign(wildcard_name, join(segments, i));
                return wildcard.get();
            }

            return nullptr;
        }

        auto format_to(
            std::back_insert_iterator<fmt::memory_buffer>& out,
            std::string_view label,
            int level
        ) const -> void {
            for (auto i = 0; i < level * 2; ++i) fmt::format_to(out, " ");

            if (value) fmt::format_to(out, "{} [{}]\n", label, *value);
            else fmt::format_to(out, "{}\n", label);

            for (const auto& [segment, child] : literals) {
                child->format_to(out, segment, level + 1);
            }

            if (param) {
                param->format_to(
                    out,
                    fmt::format(":{}", param_name),
                    level + 1
                );
            }

            if (wildcard) {
                wildcard->format_to(
                    out,
                    wildcard_name == "*" ?
                        std::string("*") : fmt::format("*{}", wildcard_name),
                    level + 1
                );
            }
        }
    public:
        node() = default;

        auto find(
            const std::vector<std::string>& segments
        ) const -> std::optional<match<T>> {
            auto params = params_map();

            if (const auto* const result = find(segments, 0, params)) {
                return match<T> {
                    .value = result->value ? &*result->value : nullptr,
                    .params = std::move(params)
                };
            }

            return std::nullopt;
        }

        /// Normalizes the path and percent-decodes each segment before
        /// matching. A query string must already have been removed.
        auto find(std::string_view path) const -> std::optional<match<T>> {
            auto segments = split_path(path);
            for (auto& segment : segments) segment = percent_decode(segment);
            return find(segments);
        }

        /// Returns the value slot at the end of the route, creating nodes
        /// and a default value as needed.
        auto insert(const std::vector<std::string>& segments) -> T& {
            auto* current = this;
            auto names = std::vector<std::string_view>();

            for (std::size_t i = 0; i < segments.size(); ++i) {
                const auto& segment = segments[i];
                if (segment.empty()) continue;

                const auto first = segment.front();

                if (first == ':') {
                    const auto name = std::string_view(segment).substr(1);

                    if (name.empty()) {
                        throw build_error(
                            "unnamed path parameter in '/{}'",
                            fmt::join(segments, "/")
                        );
                    }

                    if (current->param && current->param_name != name) {
                        throw build_error(
                            "param collision :{} -> :{}",
                            current->param_name,
                            name
                        );
                    }

                    if (!current->param) {
                        current->param = std::make_unique<node>();
                        current->param_name = name;
                    }

                    names.push_back(name);
                    current = current->param.get();
                }
                else if (first == '*') {
                    if (i + 1 != segments.size()) {
                        throw build_error(
                            "wildcard must be the last segment of '/{}'",
                            fmt::join(segments, "/")
                        );
                    }

                    const auto name = segment.size() == 1 ?
                        std::string_view(segment) :
                        std::string_view(segment).substr(1);

                    if (current->wildcard && current->wildcard_name != name) {
                        throw build_error(
                            "wildcard collision *{} -> *{}",
                            current->wildcard_name,
                            name
                        );
                    }

                    if (!current->wildcard) {
                        current->wildcard = std::make_unique<node>();
                        current->wildcard_name = name;
                    }

                    names.push_back(name);
                    current = current->wildcard.get();
                }
                else {
                    auto& child = current->literals[segment];
                    if (!child) child = std::make_unique<node>();
                    current = child.get();
                }
            }

            for (auto it = names.begin(); it != names.end(); ++it) {
                if (std::find(std::next(it), names.end(), *it) != names.end()) {
                    throw build_error(
                        "duplicate parameter '{}' in '/{}'",
                        *it,
                        fmt::join(segments, "/")
                    );
                }
            }

            if (!current->value) current->value.emplace();
            return *current->value;
        }

        auto to_string() const -> std::string {
            auto buffer = fmt::memory_buffer();
            auto out = std::back_inserter(buffer);

            format_to(out, "/", 0);

            return fmt::to_string(buffer);
        }
    };
}
