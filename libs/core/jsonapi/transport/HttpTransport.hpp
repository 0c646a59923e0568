#pragma once
#include <string>
#include <utility>
#include <vector>
#include "jsonapi/errors/Result.hpp"

namespace Tuner {

struct HttpRequest {
    std::string scheme = "https";   // "https" or "http"
    std::string host;
    std::string port;
    std::string target;     // path + query
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;
};

// Pure transport interface (no API logic). POSTs one request and waits for the reply.
class HttpTransport {
public:
    HttpTransport() = default;
    virtual ~HttpTransport() = default;

    /// Connection and I/O failures come back as TransportError; any HTTP status is a success here.
    virtual Result<HttpResponse> post(const HttpRequest& request) = 0;
};

} // namespace Tuner
