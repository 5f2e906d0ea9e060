#pragma once

#include <charconv>
#include <chrono>
#include <concepts>
#include <fmt/format.h>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace arbor {
    struct parser_error : std::runtime_error {
        parser_error(const std::string& what) : runtime_error(what) {}
    };

    /// Converts the textual form of a path parameter, query parameter or
    /// header into a typed value.
    template <typename T>
    struct parser {};

    template <>
    struct parser<std::string_view> {
        static auto parse(std::string_view string) -> std::string_view {
            return string;
        }
    };

    template <>
    struct parser<std::string> {
        static auto parse(std::string_view string) -> std::string {
            return std::string(string);
        }
    };

    template <typename T>
    struct parser<std::optional<T>> {
        static auto parse(std::string_view string) -> std::optional<T> {
            return parser<T>::parse(string);
        }
    };

    template <>
    struct parser<bool> {
        static auto parse(std::string_view string) -> bool {
            if (string == "true" || string == "1" || string == "yes") {
                return true;
            }

            if (string == "false" || string == "0" || string == "no") {
                return false;
            }

            throw parser_error("Expect true/false, 1/0 or yes/no");
        }
    };

    template <typename T>
    requires std::integral<T> || std::floating_point<T>
    struct parser<T> {
        static auto parse(std::string_view argument) -> T {
            auto value = T();

            const auto* const first = argument.data();
            const auto* const last = first + argument.size();

            const auto [ptr, ec] = std::from_chars(first, last, value);

            if (ec == std::errc::result_out_of_range) {
                throw parser_error(fmt::format(
                    "Argument '{}' is outside the range of {} and {}",
                    argument,
                    std::numeric_limits<T>::lowest(),
                    std::numeric_limits<T>::max()
                ));
            }

            if (ec != std::errc() || ptr != last || argument.empty()) {
                if constexpr (std::integral<T>) {
                    throw parser_error("Expect an integer");
                }
                else throw parser_error("Expect a number");
            }

            return value;
        }
    };

    template <typename Rep, typename Period>
    struct parser<std::chrono::duration<Rep, Period>> {
        static auto parse(
            std::string_view string
        ) -> std::chrono::duration<Rep, Period> {
            return std::chrono::duration<Rep, Period>(
                parser<Rep>::parse(string)
            );
        }
    };
}
