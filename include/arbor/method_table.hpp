#pragma once

#include "compose.hpp"
#include "handler.hpp"
#include "validate.hpp"

#include <fmt/format.h>
#include <map>

namespace arbor {
    struct route_entry {
        arbor::handler handler;
        std::optional<validate_spec> validate;
        std::vector<middleware> stack;

        /// The stack composed around the handler.
        middleware chain;
    };

    /// The routes registered for one path, keyed by method.
    class method_table {
        std::map<std::string, route_entry, std::less<>> methods;
    public:
        method_table() = default;

        method_table(const method_table&) = delete;

        method_table(method_table&&) = default;

        auto operator=(const method_table&) -> method_table& = delete;

        auto operator=(method_table&&) -> method_table& = default;

        /// A comma separated list of the registered methods, suitable for an
        /// 'allow' header.
        auto allowed() const -> std::string;

        auto empty() const noexcept -> bool;

        auto find(std::string_view method) const -> const route_entry*;

        /// Returns false if the method is already registered.
        auto insert(std::string_view method, route_entry&& entry) -> bool;

        auto size() const noexcept -> std::size_t;
    };
}

template <>
struct fmt::formatter<arbor::method_table> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const arbor::method_table& table, FormatContext& ctx) const {
        return formatter<std::string_view>::format(table.allowed(), ctx);
    }
};
