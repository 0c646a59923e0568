#include "BeastHttpTransport.hpp"
#include "Log.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <type_traits>
#include <utility>

namespace Tuner {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

using TlsStream = beast::ssl_stream<beast::tcp_stream>;
using PlainStream = beast::tcp_stream;

// State of one request/response exchange; lives on post()'s stack while the io_context runs.
template <class Stream>
struct Exchange {
    static constexpr bool kTls = !std::is_same_v<Stream, PlainStream>;

    template <class... StreamArgs>
    Exchange(net::io_context& ioc, std::chrono::seconds timeout, StreamArgs&&... args)
        : resolver(ioc), resolveTimer(ioc), stream(ioc, std::forward<StreamArgs>(args)...), timeout(timeout) {}

    tcp::resolver resolver;
    net::steady_timer resolveTimer;
    bool resolveTimedOut = false;
    Stream stream;
    std::chrono::seconds timeout;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::response<http::string_body> res;

    beast::error_code ec;
    const char* stage = "";

    bool failed(beast::error_code e, const char* where) {
        if (!e) return false;
        ec = e;
        stage = where;
        return true;
    }

    void start(const std::string& host, const std::string& port) {
        // the resolver has no expiry of its own
        resolveTimer.expires_after(timeout);
        resolveTimer.async_wait([this](beast::error_code e) {
            if (e) return;
            resolveTimedOut = true;
            resolver.cancel();
        });
        resolver.async_resolve(host, port,
            [this](beast::error_code e, tcp::resolver::results_type results) { onResolve(e, results); });
    }

    void onResolve(beast::error_code e, tcp::resolver::results_type results) {
        resolveTimer.cancel();
        if (resolveTimedOut) e = beast::error::timeout;
        if (failed(e, "resolve")) return;
        beast::get_lowest_layer(stream).expires_after(timeout);
        beast::get_lowest_layer(stream).async_connect(results,
            [this](beast::error_code e2, tcp::resolver::results_type::endpoint_type) { onConnect(e2); });
    }

    void onConnect(beast::error_code e) {
        if (failed(e, "connect")) return;
        if constexpr (kTls) {
            beast::get_lowest_layer(stream).expires_after(timeout);
            stream.async_handshake(ssl::stream_base::client,
                [this](beast::error_code e2) { onHandshake(e2); });
        } else {
            onHandshake({});
        }
    }

    void onHandshake(beast::error_code e) {
        if (failed(e, "tls handshake")) return;
        beast::get_lowest_layer(stream).expires_after(timeout);
        http::async_write(stream, req,
            [this](beast::error_code e2, std::size_t) { onWrite(e2); });
    }

    void onWrite(beast::error_code e) {
        if (failed(e, "write")) return;
        beast::get_lowest_layer(stream).expires_after(timeout);
        http::async_read(stream, buffer, res,
            [this](beast::error_code e2, std::size_t) { onRead(e2); });
    }

    void onRead(beast::error_code e) {
        if (failed(e, "read")) return;
        if constexpr (kTls) {
            beast::get_lowest_layer(stream).expires_after(timeout);
            stream.async_shutdown([](beast::error_code e2) {
                // servers commonly drop the connection without close_notify
                if (e2 && e2 != net::error::eof && e2 != ssl::error::stream_truncated) {
                    LOG_D("transport", "tls shutdown: {}", e2.message());
                }
            });
        } else {
            beast::error_code e2;
            stream.socket().shutdown(tcp::socket::shutdown_both, e2);
            if (e2 && e2 != beast::errc::not_connected) {
                LOG_D("transport", "tcp shutdown: {}", e2.message());
            }
        }
    }
};

template <class Stream>
Result<HttpResponse> runExchange(Exchange<Stream>& ex, net::io_context& ioc,
                                 const std::string& userAgent, const HttpRequest& request) {
    ex.req.method(http::verb::post);
    ex.req.target(request.target);
    ex.req.version(11);
    ex.req.set(http::field::host, request.host);
    ex.req.set(http::field::user_agent, userAgent);
    for (const auto& [name, value] : request.headers) {
        ex.req.set(name, value);
    }
    ex.req.body() = request.body;
    ex.req.prepare_payload();

    LOG_T("transport", "POST {}://{}:{}{} ({} bytes)", request.scheme, request.host, request.port,
          request.target.substr(0, request.target.find('?')), request.body.size());

    ex.start(request.host, request.port);
    ioc.restart();
    ioc.run();

    if (ex.ec) {
        LOG_E("transport", "{} {}:{} failed: {}", ex.stage, request.host, request.port, ex.ec.message());
        return Result<HttpResponse>::failure(TransportError{std::string(ex.stage) + ": " + ex.ec.message()});
    }

    HttpResponse response;
    response.status = ex.res.result_int();
    response.body = std::move(ex.res.body());
    return Result<HttpResponse>::success(std::move(response));
}

} // namespace

BeastHttpTransport::BeastHttpTransport(std::chrono::seconds timeout)
    : sslCtx_(ssl::context::tlsv12_client)
    , timeout_(timeout)
    , userAgent_(BOOST_BEAST_VERSION_STRING)
{
    beast::error_code ec;
    sslCtx_.set_default_verify_paths(ec);
    if (ec) {
        LOG_W("transport", "could not load default CA paths: {}", ec.message());
    }
    sslCtx_.set_verify_mode(ssl::verify_peer);
}

Result<HttpResponse> BeastHttpTransport::post(const HttpRequest& request) {
    if (request.scheme == "http") {
        Exchange<PlainStream> ex(ioc_, timeout_);
        return runExchange(ex, ioc_, userAgent_, request);
    }
    if (request.scheme != "https") {
        LOG_E("transport", "unsupported scheme '{}' for {}", request.scheme, request.host);
        return Result<HttpResponse>::failure(TransportError{"unsupported scheme '" + request.scheme + "'"});
    }

    Exchange<TlsStream> ex(ioc_, timeout_, sslCtx_);

    auto sslFailure = [&](const char* stage) {
        beast::error_code sslEc(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return Result<HttpResponse>::failure(TransportError{std::string(stage) + ": " + sslEc.message()});
    };
    if (!SSL_set_tlsext_host_name(ex.stream.native_handle(), request.host.c_str())) {
        return sslFailure("sni");
    }
    if (!SSL_set1_host(ex.stream.native_handle(), request.host.c_str())) {
        return sslFailure("hostname verification");
    }
    return runExchange(ex, ioc_, userAgent_, request);
}

} // namespace Tuner
