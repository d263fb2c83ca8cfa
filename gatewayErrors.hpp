#pragma once

#include <httplib.h>

#include <stdexcept>
#include <string>

namespace Gateway {
    // No daemon is known for the tenant named in the request path.
    class ResolutionError : public std::runtime_error {
        std::string tenant_;

    public:
        explicit ResolutionError(const std::string& tenant)
            : std::runtime_error("No daemon registered for tenant '" + tenant + "'"), tenant_(tenant) {}

        const std::string& tenant() const { return tenant_; }
    };

    // The daemon could not be reached, stopped answering or the call was cancelled.
    class TransportError : public std::runtime_error {
        httplib::Error error_;
        std::string url_;

    public:
        TransportError(const std::string& message, httplib::Error error, std::string url)
            : std::runtime_error(message + " (" + url + ")"), error_(error), url_(std::move(url)) {}

        httplib::Error error() const { return error_; }
        const std::string& url() const { return url_; }
        bool timedOut() const { return error_ == httplib::Error::Read; }
        bool cancelled() const { return error_ == httplib::Error::Canceled; }
    };
}
