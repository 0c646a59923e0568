#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace Tuner {

/// One logical API call: method name, parameter object and whether the body travels encrypted.
/// Request types expose `toCall()` producing one of these plus a nested `Response` type.
struct ApiCall {
    std::string method;
    nlohmann::ordered_json params = nlohmann::ordered_json::object();
    bool encrypt = false;
};

} // namespace Tuner
