#pragma once

#include <httplib.h>

#include <chrono>
#include <functional>
#include <string>

#include "lib/request.hpp"

namespace Gateway {
    struct UpstreamResponse {
        int status = 0;
        httplib::Headers headers;
        std::string body;
    };

    // Called once with the daemon's status line and headers, before any body bytes.
    using HeadHandler = std::function<bool(int status, const httplib::Headers& headers)>;
    // Called for each piece of the body as it arrives.
    using ChunkHandler = std::function<bool(const char* data, size_t length)>;

    // Sends a built request to its daemon. One attempt, no retries.
    class Transport {
    public:
        virtual ~Transport() = default;

        // Any status the daemon answers with is delivered; only failures to talk to it throw TransportError.
        // A handler returning false ends the exchange, reported as a cancelled TransportError.
        virtual void stream(const Docker::RequestDescriptor& request, const HeadHandler& onHead,
                            const ChunkHandler& onChunk) const = 0;

        // Collects the whole response. For short exchanges such as the startup ping.
        UpstreamResponse send(const Docker::RequestDescriptor& request) const;
    };

    class HttplibTransport : public Transport {
        std::chrono::seconds connectTimeout_;
        std::chrono::seconds readTimeout_;

    public:
        HttplibTransport(std::chrono::seconds connectTimeout, std::chrono::seconds readTimeout)
            : connectTimeout_(connectTimeout), readTimeout_(readTimeout) {}

        void stream(const Docker::RequestDescriptor& request, const HeadHandler& onHead,
                    const ChunkHandler& onChunk) const override;
    };

    // Throws Docker::UpstreamError unless the status is 2xx.
    const UpstreamResponse& expectSuccess(const UpstreamResponse& response, const Docker::RequestDescriptor& request);
}
