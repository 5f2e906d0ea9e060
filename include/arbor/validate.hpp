#pragma once

#include "context.hpp"

#include <functional>
#include <memory>

namespace arbor {
    /// Anything that can check and coerce an input value. parse() throws
    /// when the input is invalid.
    struct schema {
        virtual ~schema() = default;

        virtual auto parse(const json& input) const -> json = 0;
    };

    using schema_ptr = std::shared_ptr<const schema>;

    namespace detail {
        template <typename F>
        class function_schema final : public schema {
            F fn;
        public:
            explicit function_schema(F&& fn) : fn(std::forward<F>(fn)) {}

            explicit function_schema(const F& fn) : fn(fn) {}

            auto parse(const json& input) const -> json override {
                return fn(input);
            }
        };
    }

    template <typename F>
    requires std::is_invocable_r_v<json, const std::decay_t<F>&, const json&>
    auto make_schema(F&& f) -> schema_ptr {
        return std::make_shared<detail::function_schema<std::decay_t<F>>>(
            std::forward<F>(f)
        );
    }

    struct validate_spec {
        schema_ptr params;
        schema_ptr body;
        schema_ptr query;
        schema_ptr headers;
        schema_ptr cookies;

        /// Runs after the schemas with access to the whole context.
        std::function<void(context&)> custom;
    };

    /// Replaces each context field that has a schema with the schema's
    /// result. Exceptions thrown by a schema are not caught.
    auto validate(const validate_spec& spec, context& ctx) -> void;
}
