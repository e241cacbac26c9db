#pragma once
///@file buildjail-specific JSON handling.

#include <nlohmann/json.hpp>

namespace buildjail {

using JSON = nlohmann::json;

}
