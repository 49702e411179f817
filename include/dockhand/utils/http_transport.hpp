/**
 * @file http_transport.hpp
 * @brief HTTP/1.1 requests to the container engine socket
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace dockhand {
namespace utils {

/**
 * @struct HttpRequest
 * @brief One request to the engine API
 */
struct HttpRequest {
    std::string method{"GET"};                   ///< GET, POST or DELETE
    std::string target;                          ///< Path and query ("/containers/json?all=true")
    std::string body;                            ///< JSON body (empty for none)
    std::map<std::string, std::string> headers;  ///< Extra headers
    std::optional<std::chrono::seconds> timeout; ///< Deadline for the whole exchange
};

/**
 * @struct HttpResponse
 * @brief Status and body of an engine reply
 */
struct HttpResponse {
    int status{0};     ///< HTTP status code
    std::string body;  ///< Response body
};

/**
 * @class HttpTransport
 * @brief Abstract request seam used by the engine API adapter
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform a request and read the full response
     * @throws core::TimeoutError if the request deadline expires
     * @throws core::BackendInvocationError on connection or protocol errors
     */
    virtual HttpResponse Send(const HttpRequest& request) = 0;
};

/**
 * @class UnixSocketTransport
 * @brief Boost.Beast client over a unix domain socket
 *
 * Opens one connection per request; `Host: localhost` is sent as the
 * engine expects.
 */
class UnixSocketTransport : public HttpTransport {
public:
    explicit UnixSocketTransport(std::string socket_path = "/var/run/docker.sock");

    HttpResponse Send(const HttpRequest& request) override;

    const std::string& GetSocketPath() const { return socket_path_; }

private:
    std::string socket_path_;  ///< Engine socket path
};

} // namespace utils
} // namespace dockhand
