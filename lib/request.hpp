#ifndef DOCKGATE_REQUEST_HPP
#define DOCKGATE_REQUEST_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "endpoint.hpp"

namespace Docker {
    enum class Method {Get, Head, Post, Put, Patch, Delete};

    std::string methodName(Method method);

    struct CaseInsensitiveLess {
        bool operator()(const std::string& a, const std::string& b) const;
    };

    bool sameHeader(const std::string& a, const std::string& b);

    using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    extern const std::string CONTENT_TYPE_JSON;
    extern const std::string CONTENT_TYPE_TAR;
    extern const std::string REGISTRY_AUTH_HEADER;

    struct Body {
        std::string data;
        std::string contentType;
    };

    class RequestDescriptor;

    RequestDescriptor makeRequest(const DaemonEndpoint& endpoint, Method method, const std::string& path,
                                  std::optional<Body> body = std::nullopt, const HeaderList& headers = {});

    // A fully assembled request that has not been sent. Only makeRequest builds one.
    class RequestDescriptor {
        Method method_;
        std::string url_;
        std::string target_;
        DaemonEndpoint endpoint_;
        Headers headers_;
        std::optional<Body> body_;

        RequestDescriptor(Method method, std::string url, std::string target, DaemonEndpoint endpoint,
                          Headers headers, std::optional<Body> body);

        friend RequestDescriptor makeRequest(const DaemonEndpoint&, Method, const std::string&,
                                             std::optional<Body>, const HeaderList&);

    public:
        Method method() const { return method_; }
        // Absolute URL: endpoint base, path and query.
        const std::string& url() const { return url_; }
        // Path and query only, as written on the request line.
        const std::string& target() const { return target_; }
        const DaemonEndpoint& endpoint() const { return endpoint_; }
        const Headers& headers() const { return headers_; }
        const std::optional<Body>& body() const { return body_; }

        // One-line rendering for logs, with credentials masked.
        std::string describe() const;
    };
}

#endif // DOCKGATE_REQUEST_HPP
