#pragma once

#include <httplib.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "transport.hpp"

namespace Gateway {
    // Hands one daemon response from the transport thread to the inbound connection.
    // At most limit bytes of body wait in memory; the producer blocks until the reader drains them.
    class ResponsePipe {
        mutable std::mutex mutex_;
        std::condition_variable changed_;
        const size_t limit_;

        std::optional<int> status_;
        httplib::Headers headers_;
        std::deque<std::string> chunks_;
        size_t buffered_ = 0;
        bool finished_ = false;
        bool closed_ = false;
        std::exception_ptr error_;

    public:
        enum class Wait {head, finished, cancelled};
        enum class Pull {data, idle, end};

        explicit ResponsePipe(size_t limit) : limit_(limit) {}

        // Producer side. Both return false once the reader has closed the pipe.
        bool head(int status, const httplib::Headers& headers);
        bool push(const char* data, size_t length);
        void finish(std::exception_ptr error = nullptr);

        // Reader side. cancelled is polled every tick while nothing has arrived.
        Wait waitForHead(const std::function<bool()>& cancelled, std::chrono::milliseconds tick);
        // Moves every queued chunk into out. idle means tick passed without data.
        Pull pull(std::string& out, std::chrono::milliseconds tick);
        void close();

        int status() const;
        httplib::Headers headers() const;
        std::exception_ptr error() const;
    };

    // One transport call running on its own thread and feeding a pipe. Destruction closes the pipe and joins.
    class UpstreamExchange {
        std::shared_ptr<ResponsePipe> pipe_;
        std::thread worker_;

    public:
        UpstreamExchange(std::shared_ptr<const Transport> transport, Docker::RequestDescriptor request, size_t bufferLimit);
        ~UpstreamExchange();

        UpstreamExchange(const UpstreamExchange&) = delete;
        UpstreamExchange& operator=(const UpstreamExchange&) = delete;

        ResponsePipe& pipe() { return *pipe_; }
        // Waits for the transport call to return, closing the pipe first when abandon is set.
        void join(bool abandon);
    };

    // Copies the daemon's status and headers, leaving framing headers to the server.
    void relayHead(int status, const httplib::Headers& headers, httplib::Response& res);

    // Streams the exchange's body into res, keeping the daemon's length when it sent one.
    // Takes ownership of the exchange; it is joined once the inbound response is finished.
    void relayBody(std::shared_ptr<UpstreamExchange> exchange, httplib::Response& res);
}
