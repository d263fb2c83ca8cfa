#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "lib/endpoint.hpp"

namespace Gateway {
    // Maps a tenant identifier onto the daemon serving it.
    class Directory {
    public:
        virtual ~Directory() = default;

        // Throws ResolutionError when the tenant is unknown.
        virtual Docker::DaemonEndpoint resolve(const std::string& tenant) const = 0;

        // False when the tenant is only served by a shared default.
        virtual bool knows(const std::string&) const { return true; }
    };

    class StaticDirectory : public Directory {
        std::map<std::string, Docker::DaemonEndpoint> daemons_;
        std::optional<Docker::DaemonEndpoint> fallback_;

    public:
        // fallback serves every tenant missing from daemons
        explicit StaticDirectory(std::map<std::string, Docker::DaemonEndpoint> daemons,
                                 std::optional<Docker::DaemonEndpoint> fallback = std::nullopt);

        Docker::DaemonEndpoint resolve(const std::string& tenant) const override;
        bool knows(const std::string& tenant) const override { return daemons_.contains(tenant); }
    };

    // Remembers successful resolutions of known tenants for a fixed time, holding at most capacity entries.
    // Misses and fallback resolutions always reach the source.
    class CachingDirectory : public Directory {
    public:
        using Clock = std::chrono::steady_clock;

    private:
        struct Entry {
            Docker::DaemonEndpoint endpoint;
            Clock::time_point expires;
        };

        std::shared_ptr<const Directory> source_;
        std::chrono::seconds ttl_;
        size_t capacity_;
        std::function<Clock::time_point()> now_;
        mutable std::mutex mutex_;
        mutable std::map<std::string, Entry> entries_;

    public:
        static constexpr size_t DEFAULT_CAPACITY = 1024;

        CachingDirectory(std::shared_ptr<const Directory> source, std::chrono::seconds ttl,
                         std::function<Clock::time_point()> now = Clock::now, size_t capacity = DEFAULT_CAPACITY);

        Docker::DaemonEndpoint resolve(const std::string& tenant) const override;
        bool knows(const std::string& tenant) const override { return source_->knows(tenant); }
        size_t size() const;
    };
}
