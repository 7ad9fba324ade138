#pragma once

#include <nlohmann/json.hpp>

namespace call_bridge {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

}
