#include "relay.hpp"

#include <set>
#include <stdexcept>

#include "lib/request.hpp"

namespace {
    // Length and connection handling belong to the inbound server.
    const std::set<std::string, Docker::CaseInsensitiveLess> FRAMING_HEADERS = {
        "Content-Length", "Transfer-Encoding", "Connection", "Keep-Alive"
    };

    constexpr std::chrono::milliseconds WRITE_TICK(100);

    std::optional<size_t> contentLength(const httplib::Headers& headers) {
        auto it = headers.find("Content-Length");
        if (it == headers.end()) return std::nullopt;
        try {
            size_t consumed = 0;
            unsigned long long length = std::stoull(it->second, &consumed);
            if (consumed != it->second.size()) return std::nullopt;
            return static_cast<size_t>(length);
        } catch (const std::logic_error&) {
            // Unusable length; the body goes out chunked instead
            return std::nullopt;
        }
    }

    bool forward(Gateway::ResponsePipe& pipe, httplib::DataSink& sink, bool chunked) {
        std::string chunk;
        while (true) {
            switch (pipe.pull(chunk, WRITE_TICK)) {
                case Gateway::ResponsePipe::Pull::data:
                    return sink.write(chunk.data(), chunk.size());
                case Gateway::ResponsePipe::Pull::idle:
                    if (!sink.is_writable()) return false;
                    break;
                case Gateway::ResponsePipe::Pull::end:
                    // A failed read, or a fixed-length body cut short, aborts the inbound connection
                    if (!chunked || pipe.error()) return false;
                    sink.done();
                    return true;
            }
        }
    }
}

namespace Gateway {
    bool ResponsePipe::head(int status, const httplib::Headers& headers) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        status_ = status;
        headers_ = headers;
        changed_.notify_all();
        return true;
    }

    bool ResponsePipe::push(const char* data, size_t length) {
        std::unique_lock<std::mutex> lock(mutex_);
        changed_.wait(lock, [this] { return closed_ || buffered_ < limit_; });
        if (closed_) return false;
        chunks_.emplace_back(data, length);
        buffered_ += length;
        changed_.notify_all();
        return true;
    }

    void ResponsePipe::finish(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        error_ = error;
        changed_.notify_all();
    }

    ResponsePipe::Wait ResponsePipe::waitForHead(const std::function<bool()>& cancelled, std::chrono::milliseconds tick) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!status_ && !finished_) {
            if (cancelled && cancelled()) return Wait::cancelled;
            changed_.wait_for(lock, tick);
        }
        return status_ ? Wait::head : Wait::finished;
    }

    ResponsePipe::Pull ResponsePipe::pull(std::string& out, std::chrono::milliseconds tick) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!changed_.wait_for(lock, tick, [this] { return !chunks_.empty() || finished_ || closed_; })) {
            return Pull::idle;
        }
        if (chunks_.empty()) return Pull::end;
        out.clear();
        for (const auto& chunk : chunks_) out += chunk;
        chunks_.clear();
        buffered_ = 0;
        changed_.notify_all();
        return Pull::data;
    }

    void ResponsePipe::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        changed_.notify_all();
    }

    int ResponsePipe::status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_.value_or(0);
    }

    httplib::Headers ResponsePipe::headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return headers_;
    }

    std::exception_ptr ResponsePipe::error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    UpstreamExchange::UpstreamExchange(std::shared_ptr<const Transport> transport, Docker::RequestDescriptor request,
                                       size_t bufferLimit)
        : pipe_(std::make_shared<ResponsePipe>(bufferLimit)) {
        worker_ = std::thread([transport = std::move(transport), request = std::move(request), pipe = pipe_] {
            try {
                transport->stream(request,
                    [&pipe](int status, const httplib::Headers& headers) { return pipe->head(status, headers); },
                    [&pipe](const char* data, size_t length) { return pipe->push(data, length); });
                pipe->finish();
            } catch (...) {
                // The reader rethrows or reports it
                pipe->finish(std::current_exception());
            }
        });
    }

    UpstreamExchange::~UpstreamExchange() {
        join(true);
    }

    void UpstreamExchange::join(bool abandon) {
        if (abandon) pipe_->close();
        if (worker_.joinable()) worker_.join();
    }

    void relayHead(int status, const httplib::Headers& headers, httplib::Response& res) {
        res.status = status;
        for (const auto& [name, value] : headers) {
            if (FRAMING_HEADERS.contains(name)) continue;
            res.headers.emplace(name, value);
        }
    }

    void relayBody(std::shared_ptr<UpstreamExchange> exchange, httplib::Response& res) {
        const int status = exchange->pipe().status();
        const httplib::Headers headers = exchange->pipe().headers();
        const std::optional<size_t> length = contentLength(headers);

        if (status < 200 || status == 204 || status == 304 || length == 0) {
            exchange->join(true);
            return;
        }

        std::string contentType = "application/octet-stream";
        if (auto it = headers.find("Content-Type"); it != headers.end()) contentType = it->second;
        // The provider setters add their own Content-Type
        res.headers.erase("Content-Type");

        auto release = [exchange](bool) { exchange->join(true); };
        if (length) {
            res.set_content_provider(*length, contentType,
                [exchange](size_t, size_t, httplib::DataSink& sink) { return forward(exchange->pipe(), sink, false); },
                release);
        } else {
            res.set_chunked_content_provider(contentType,
                [exchange](size_t, httplib::DataSink& sink) { return forward(exchange->pipe(), sink, true); },
                release);
        }
    }
}
