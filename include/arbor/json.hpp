#pragma once

#include <nlohmann/json.hpp>

namespace arbor {
    using json = nlohmann::json;
}
