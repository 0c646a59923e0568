#pragma once
#include <string>
#include <utility>

namespace Tuner {

// Where JSON API calls are POSTed.
struct Endpoint {
    std::string scheme = "https";
    std::string host;
    std::string port = "443";
    std::string path = "/services/json";

    static Endpoint forHost(std::string host) {
        Endpoint ep;
        ep.host = std::move(host);
        return ep;
    }

    /// scheme://host/path, with the port only when it differs from the scheme default.
    std::string url() const {
        const bool defaultPort = (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
        return scheme + "://" + host + (defaultPort ? "" : ":" + port) + path;
    }
};

} // namespace Tuner
