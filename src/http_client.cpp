#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef STOCK_SYNC_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace stock_sync {

namespace {

http::verb toVerb(HttpRequest::Method method) {
    switch (method) {
        case HttpRequest::Method::Get:  return http::verb::get;
        case HttpRequest::Method::Post: return http::verb::post;
        case HttpRequest::Method::Put:  return http::verb::put;
    }
    return http::verb::get;
}

http::request<http::string_body>
buildRequest(const HttpRequest& request, const UrlParts& url) {
    http::request<http::string_body> req{toVerb(request.method), url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "stock_sync/1.0");
    if (!request.body.empty()) {
        req.set(http::field::content_type, "application/json");
    }
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

/// Write the request and read the full response on an already connected
/// stream (plain tcp_stream or ssl_stream<tcp_stream>).
template <class Stream>
HttpResponse exchange(Stream& stream,
                      const http::request<http::string_body>& req,
                      std::chrono::milliseconds timeout) {
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(HttpClient::kMaxBodyBytes);
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::read(stream, buffer, parser);

    auto res = parser.release();

    HttpResponse response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());
    const auto link     = res[http::field::link];
    response.link.assign(link.data(), link.size());
    return response;
}

/// Path without the query string, so secrets passed as query parameters
/// never reach the log.
std::string redactedTarget(const std::string& target) {
    return target.substr(0, target.find('?'));
}

} // namespace

const char* toString(HttpRequest::Method method) {
    switch (method) {
        case HttpRequest::Method::Get:  return "GET";
        case HttpRequest::Method::Post: return "POST";
        case HttpRequest::Method::Put:  return "PUT";
    }
    return "?";
}

HttpResponse HttpClient::send(const HttpRequest& request) {
    const auto url     = parseUrl(request.url);
    const auto timeout = std::chrono::milliseconds(request.timeoutMs);
    const auto req     = buildRequest(request, url);

    if (mVerbose) {
        std::cerr << "[HttpClient] " << toString(request.method) << " "
                  << url.scheme << "://" << url.host << ":" << url.port
                  << redactedTarget(url.target) << "\n";
    }

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    HttpResponse    response;

    if (url.scheme == "https") {
#ifdef STOCK_SYNC_HAS_SSL
        namespace ssl = net::ssl;

        ssl::context ctx(ssl::context::tlsv12_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

        // SNI hostname.
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw std::runtime_error("Failed to set SNI hostname");
        }

        auto const results = resolver.resolve(url.host, url.port);
        beast::get_lowest_layer(stream).expires_after(timeout);
        beast::get_lowest_layer(stream).connect(results);
        stream.handshake(ssl::stream_base::client);

        response = exchange(stream, req, timeout);

        // Many servers close without close_notify; not an error for us.
        beast::error_code ec;
        stream.shutdown(ec);
#else
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    } else {
        beast::tcp_stream stream(ioc);

        auto const results = resolver.resolve(url.host, url.port);
        stream.expires_after(timeout);
        stream.connect(results);

        response = exchange(stream, req, timeout);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << response.httpStatus << " ("
                  << response.body.size() << " bytes)\n";
    }

    return response;
}

} // namespace stock_sync
