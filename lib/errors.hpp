#ifndef DOCKGATE_ERRORS_HPP
#define DOCKGATE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Docker {
    // Raised before any network call when a request cannot be assembled:
    // an unjoinable URL, an unencodable value or a malformed caller parameter.
    class RequestBuildError : public std::runtime_error {
    public:
        explicit RequestBuildError(const std::string& message) : std::runtime_error(message) {}
    };

    // The daemon answered with a non-2xx status.
    class UpstreamError : public std::runtime_error {
        int status_;
        std::string url_;
        std::string body_;

    public:
        UpstreamError(int status, std::string url, std::string body)
            : std::runtime_error("Daemon returned status " + std::to_string(status) + " for " + url),
              status_(status), url_(std::move(url)), body_(std::move(body)) {}

        int status() const { return status_; }
        const std::string& url() const { return url_; }
        const std::string& body() const { return body_; }
    };
}

#endif // DOCKGATE_ERRORS_HPP
