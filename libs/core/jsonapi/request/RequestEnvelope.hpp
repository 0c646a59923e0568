#pragma once
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "Endpoint.hpp"

namespace Tuner {

/// Transport-ready description of one POST. Built per call and discarded.
struct RequestEnvelope {
    Endpoint endpoint;
    std::string method;
    std::map<std::string, std::string> query;   // sorted by key, "method" included
    std::string body;                           // JSON text, or hex ciphertext when encrypted
    bool encrypted = false;
    std::vector<std::pair<std::string, std::string>> headers;

    /// path?query, form-urlencoded.
    std::string target() const;
    std::string url() const;
};

/// application/x-www-form-urlencoded component encoding (space becomes '+').
std::string formUrlEncode(std::string_view text);

} // namespace Tuner
