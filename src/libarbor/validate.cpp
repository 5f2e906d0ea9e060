#include <arbor/validate.hpp>

namespace {
    auto apply(const arbor::schema_ptr& schema, arbor::json& field) -> void {
        if (schema) field = schema->parse(field);
    }
}

namespace arbor {
    auto validate(const validate_spec& spec, context& ctx) -> void {
        apply(spec.params, ctx.params);
        apply(spec.body, ctx.body);
        apply(spec.query, ctx.query);
        apply(spec.headers, ctx.headers);
        apply(spec.cookies, ctx.cookies);

        if (spec.custom) spec.custom(ctx);
    }
}
