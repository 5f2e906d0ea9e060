#include <arbor/error.hpp>

namespace arbor {
    validation_error::validation_error(std::string_view what) : error(what) {}

    validation_error::validation_error(std::string_view what, json issues) :
        error(what),
        details(std::move(issues))
    {}

    auto validation_error::issues() const noexcept -> const json& {
        return details;
    }
}
