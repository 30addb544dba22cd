#pragma once

#include <nlohmann/json.hpp>

namespace agentid::schema {

using json_t = nlohmann::json;

}  // namespace agentid::schema
