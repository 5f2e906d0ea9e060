#pragma once

#include "parser.hpp"
#include "problem.hpp"
#include "request.hpp"

#include <any>
#include <map>

namespace arbor {
    namespace detail {
        template <typename T>
        struct is_optional : std::false_type {};

        template <typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        template <typename T>
        inline constexpr bool is_optional_v = is_optional<T>::value;

        template <typename T>
        auto convert(const arbor::json& value) -> T {
            if (value.is_string()) {
                return parser<T>::parse(
                    value.get_ref<const std::string&>()
                );
            }

            if constexpr (is_optional_v<T>) {
                return value.get<typename T::value_type>();
            }
            else return value.get<T>();
        }

        template <typename T>
        auto read(
            const arbor::json& object,
            const std::string& name,
            std::string_view description
        ) -> T {
            if (!object.is_object()) {
                throw std::logic_error(fmt::format(
                    "{} values are not an object",
                    description
                ));
            }

            const auto it = object.find(name);

            if (it != object.end() && !it->is_null()) {
                if constexpr (is_optional_v<T>) {
                    if (
                        it->is_string() &&
                        it->get_ref<const std::string&>().empty()
                    ) return T();
                }

                try {
                    return convert<T>(*it);
                }
                catch (const std::exception& ex) {
                    throw http_exception(400, fmt::format(
                        "Failed to parse {} '{}': {}",
                        description,
                        name,
                        ex.what()
                    ));
                }
            }
            else if constexpr (!is_optional_v<T>) {
                throw http_exception(400, fmt::format(
                    "Missing required {} '{}'",
                    description,
                    name
                ));
            }

            return T();
        }
    }

    /// Per-request state shared by the middleware chain and the route
    /// handler. A context belongs to exactly one request.
    class context {
        const arbor::request* req;
        std::optional<std::string> error;
        std::map<std::string, std::any, std::less<>> data;
    public:
        arbor::json params = arbor::json::object();
        arbor::json body;
        arbor::json query = arbor::json::object();
        arbor::json headers = arbor::json::object();
        arbor::json cookies = arbor::json::object();

        /// The response recorded by the most recent responder call.
        std::optional<response> res;

        explicit context(const arbor::request& req);

        context(const context&) = delete;

        auto operator=(const context&) -> context& = delete;

        auto request() const noexcept -> const arbor::request&;

        /// Set when the request body could not be parsed.
        auto body_error() const noexcept -> const std::optional<std::string>&;

        template <typename T = std::string>
        auto param(const std::string& name) const -> T {
            return detail::read<T>(params, name, "path parameter");
        }

        template <typename T = std::string>
        auto query_param(const std::string& name) const -> T {
            return detail::read<T>(query, name, "query parameter");
        }

        template <typename T = std::string>
        auto header(std::string_view name) const -> T {
            return detail::read<T>(headers, to_lower(name), "header");
        }

        auto has(std::string_view key) const -> bool;

        auto set(std::string_view key, std::any value) -> void;

        template <typename T>
        auto get(std::string_view key) const -> T {
            const auto it = data.find(key);

            if (it == data.end()) {
                throw std::out_of_range(fmt::format(
                    "context has no value for key '{}'",
                    key
                ));
            }

            try {
                return std::any_cast<T>(it->second);
            }
            catch (const std::bad_any_cast&) {
                throw std::invalid_argument(fmt::format(
                    "context value for key '{}' has a different type",
                    key
                ));
            }
        }

        auto json(const arbor::json& value, int status) -> response;

        auto json(
            const arbor::json& value,
            response_init init = {}
        ) -> response;

        auto text(std::string_view value, int status) -> response;

        auto text(std::string_view value, response_init init = {})
            -> response;

        auto html(std::string_view value, int status) -> response;

        auto html(std::string_view value, response_init init = {})
            -> response;

        auto redirect(std::string_view location, int status = 302)
            -> response;
    };
}
