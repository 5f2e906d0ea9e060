#pragma once

#include "headers.hpp"

#include <fmt/format.h>
#include <optional>

namespace arbor {
    /// A request as delivered by a transport adapter. The body has already
    /// been read in full.
    struct request {
        std::string method = "GET";
        std::string target = "/";
        header_map headers;
        std::string body;

        auto header(std::string_view name) const
            -> std::optional<std::string_view>;

        auto path() const -> std::string_view;

        auto query() const -> std::string_view;
    };
}

template <>
struct fmt::formatter<arbor::request> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const arbor::request& request, FormatContext& ctx) const {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        fmt::format_to(out, "{} {}", request.method, request.target);

        if (!request.headers.empty()) {
            fmt::format_to(out, "\nHeaders ({}):", request.headers.size());

            for (const auto& entry : request.headers) {
                fmt::format_to(out, "\n\t{}: {}", entry.first, entry.second);
            }
        }

        if (!request.body.empty()) {
            fmt::format_to(out, "\nBody: {} bytes", request.body.size());
        }

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};
