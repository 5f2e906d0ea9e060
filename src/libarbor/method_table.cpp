#include <arbor/method_table.hpp>

#include <fmt/ranges.h>

namespace arbor {
    auto method_table::allowed() const -> std::string {
        auto names = std::vector<std::string_view>();
        names.reserve(methods.size());

        for (const auto& entry : methods) names.push_back(entry.first);

        return fmt::format("{}", fmt::join(names, ", "));
    }

    auto method_table::empty() const noexcept -> bool {
        return methods.empty();
    }

    auto method_table::find(
        std::string_view method
    ) const -> const route_entry* {
        const auto result = methods.find(method);

        if (result == methods.end()) return nullptr;
        return &result->second;
    }

    auto method_table::insert(std::string_view method, route_entry&& entry)
        -> bool
    {
        return methods.try_emplace(
            std::string(method),
            std::forward<route_entry>(entry)
        ).second;
    }

    auto method_table::size() const noexcept -> std::size_t {
        return methods.size();
    }
}
