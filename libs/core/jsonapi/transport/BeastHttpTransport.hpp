/*
Tuner - BeastHttpTransport
Role: HttpTransport over Boost.Beast HTTP/1.1, with OpenSSL TLS for https and a plain TCP stream for http.
Inputs/Outputs: One HttpRequest in, one HttpResponse (or TransportError) out; a fresh connection per call.
Threading: Blocking; one call at a time per instance (ApiClient serializes calls).
Related: HttpTransport.hpp, ApiClient.hpp.
Assumptions: The system trust store verifies the API host's certificate. Other schemes are rejected.
Timeouts: Each step (resolve, connect, handshake, write, read) gets its own expiry of `timeout`.
*/
#pragma once
#include "HttpTransport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <string>

namespace Tuner {

namespace net = boost::asio;
namespace ssl = net::ssl;

class BeastHttpTransport : public HttpTransport {
public:
    explicit BeastHttpTransport(std::chrono::seconds timeout = std::chrono::seconds(30));

    Result<HttpResponse> post(const HttpRequest& request) override;

    // Non-copyable (owns io and TLS contexts).
    BeastHttpTransport(const BeastHttpTransport&)            = delete;
    BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

private:
    net::io_context ioc_;
    ssl::context sslCtx_;
    std::chrono::seconds timeout_;
    std::string userAgent_;
};

} // namespace Tuner
