/**
 * @file http_transport.cpp
 * @brief Boost.Beast client for the engine's unix domain socket
 *
 * **Request Flow**:
 * ```
 * async_connect ──▶ async_write(request) ──▶ async_read(response) ──▶ close
 * ```
 * The whole chain shares one deadline when the request carries a timeout.
 *
 * @date 2025
 */

#include "dockhand/utils/http_transport.hpp"
#include "dockhand/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <limits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using stream_protocol = net::local::stream_protocol;

namespace dockhand {
namespace utils {

namespace {

constexpr int kHttpVersion = 11;
constexpr const char* kUserAgent = "dockhand";

http::request<http::string_body> MakeRequest(const HttpRequest& request) {
    http::request<http::string_body> req;

    http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        req.method_string(request.method);
    } else {
        req.method(verb);
    }

    req.target(request.target);
    req.version(kHttpVersion);
    req.set(http::field::host, "localhost");
    req.set(http::field::user_agent, kUserAgent);

    if (!request.body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = request.body;
    }

    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }

    req.prepare_payload();
    return req;
}

} // anonymous namespace

UnixSocketTransport::UnixSocketTransport(std::string socket_path)
    : socket_path_(std::move(socket_path)) {
}

HttpResponse UnixSocketTransport::Send(const HttpRequest& request) {
    spdlog::debug("{} {} via {}", request.method, request.target, socket_path_);

    net::io_context ioc;
    beast::basic_stream<stream_protocol> stream(ioc);

    auto req = MakeRequest(request);
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

    beast::error_code failure;
    std::string stage = "connect";

    if (request.timeout) {
        stream.expires_after(*request.timeout);
    }

    stream.async_connect(stream_protocol::endpoint(socket_path_),
        [&](beast::error_code ec) {
            if (ec) {
                failure = ec;
                return;
            }
            stage = "write";
            http::async_write(stream, req,
                [&](beast::error_code ec, std::size_t) {
                    if (ec) {
                        failure = ec;
                        return;
                    }
                    stage = "read";
                    http::async_read(stream, buffer, parser,
                        [&](beast::error_code ec, std::size_t) {
                            failure = ec;
                        });
                });
        });

    ioc.run();

    beast::error_code ignored;
    stream.socket().shutdown(stream_protocol::socket::shutdown_both, ignored);

    if (failure == beast::error::timeout) {
        throw core::TimeoutError("Request " + request.method + " " + request.target +
                                 " timed out after " + std::to_string(request.timeout->count()) + "s");
    }
    if (failure) {
        throw core::BackendInvocationError("Engine request failed during " + stage,
                                           socket_path_ + ": " + failure.message());
    }

    HttpResponse response;
    response.status = static_cast<int>(parser.get().result_int());
    response.body = parser.get().body();

    spdlog::debug("{} {} -> {}", request.method, request.target, response.status);
    return response;
}

} // namespace utils
} // namespace dockhand
