#pragma once

#include <nlohmann/json.hpp>

namespace remex {

using Json = nlohmann::json;

} // namespace remex
