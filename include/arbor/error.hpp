#pragma once

#include "json.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace arbor {
    class error : public std::runtime_error {
        static auto format_message(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(format_message(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };

    /// Thrown while building a route table that cannot be matched
    /// unambiguously.
    class build_error : public error {
    public:
        using error::error;
    };

    /// Thrown when a continuation is invoked after the chain has already
    /// advanced past its position.
    class protocol_error : public error {
    public:
        using error::error;
    };

    class validation_error : public error {
        json details;
    public:
        validation_error(std::string_view what);

        validation_error(std::string_view what, json issues);

        template <typename... T>
        validation_error(fmt::format_string<T...> format, T&&... args) :
            error(format, std::forward<T>(args)...)
        {}

        auto issues() const noexcept -> const json&;
    };
}
