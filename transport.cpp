#include "transport.hpp"

#include <memory>

#include "gatewayErrors.hpp"
#include "lib/errors.hpp"

namespace {
    std::unique_ptr<httplib::Client> connect(const Docker::DaemonEndpoint& endpoint, const std::string& url) {
        if (endpoint.kind() == Docker::DaemonEndpoint::Kind::socket) {
            auto client = std::make_unique<httplib::Client>(endpoint.socketPath());
            client->set_address_family(AF_UNIX);
            return client;
        }
        if (endpoint.scheme() == "https") {
            throw Gateway::TransportError("TLS daemons are not supported", httplib::Error::SSLConnection, url);
        }
        std::string host = endpoint.host();
        // httplib takes IPv6 literals without brackets
        if (host.size() > 2 && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
        return std::make_unique<httplib::Client>(host, endpoint.port());
    }
}

namespace Gateway {
    UpstreamResponse Transport::send(const Docker::RequestDescriptor& request) const {
        UpstreamResponse response;
        stream(request,
            [&response](int status, const httplib::Headers& headers) {
                response.status = status;
                response.headers = headers;
                return true;
            },
            [&response](const char* data, size_t length) {
                response.body.append(data, length);
                return true;
            });
        return response;
    }

    void HttplibTransport::stream(const Docker::RequestDescriptor& request, const HeadHandler& onHead,
                                  const ChunkHandler& onChunk) const {
        auto client = connect(request.endpoint(), request.url());
        client->set_connection_timeout(connectTimeout_);
        client->set_read_timeout(readTimeout_);
        client->set_keep_alive(false);

        httplib::Request req;
        req.method = Docker::methodName(request.method());
        req.path = request.target();
        for (const auto& [name, value] : request.headers()) {
            req.headers.emplace(name, value);
        }
        // The default would be the socket path
        if (request.endpoint().kind() == Docker::DaemonEndpoint::Kind::socket && !req.has_header("Host")) {
            req.headers.emplace("Host", "localhost");
        }
        if (request.body()) req.body = request.body()->data;

        bool headSeen = false;
        req.response_handler = [&onHead, &headSeen](const httplib::Response& response) {
            headSeen = true;
            return onHead(response.status, response.headers);
        };
        req.content_receiver = [&onChunk](const char* data, size_t length, uint64_t, uint64_t) {
            return onChunk(data, length);
        };

        auto result = client->send(req);
        if (!result) {
            httplib::Error error = result.error();
            throw TransportError("Daemon request failed: " + httplib::to_string(error), error, request.url());
        }
        // httplib skips the response handler for bodiless methods
        if (!headSeen && !onHead(result->status, result->headers)) {
            throw TransportError("Daemon request failed: " + httplib::to_string(httplib::Error::Canceled),
                                 httplib::Error::Canceled, request.url());
        }
    }

    const UpstreamResponse& expectSuccess(const UpstreamResponse& response, const Docker::RequestDescriptor& request) {
        if (response.status < 200 || response.status >= 300) {
            throw Docker::UpstreamError(response.status, request.url(), response.body);
        }
        return response;
    }
}
