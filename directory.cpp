#include "directory.hpp"

#include <algorithm>

#include "gatewayErrors.hpp"

namespace Gateway {
    StaticDirectory::StaticDirectory(std::map<std::string, Docker::DaemonEndpoint> daemons,
                                     std::optional<Docker::DaemonEndpoint> fallback)
        : daemons_(std::move(daemons)), fallback_(std::move(fallback)) {}

    Docker::DaemonEndpoint StaticDirectory::resolve(const std::string& tenant) const {
        auto it = daemons_.find(tenant);
        if (it != daemons_.end()) return it->second;
        if (fallback_) return *fallback_;
        throw ResolutionError(tenant);
    }

    CachingDirectory::CachingDirectory(std::shared_ptr<const Directory> source, std::chrono::seconds ttl,
                                       std::function<Clock::time_point()> now, size_t capacity)
        : source_(std::move(source)), ttl_(ttl), capacity_(capacity), now_(std::move(now)) {}

    Docker::DaemonEndpoint CachingDirectory::resolve(const std::string& tenant) const {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(tenant);
            if (it != entries_.end()) {
                if (now_() < it->second.expires) return it->second.endpoint;
                entries_.erase(it);
            }
        }

        // Not under the lock: the source may be slow.
        Docker::DaemonEndpoint endpoint = source_->resolve(tenant);
        if (capacity_ == 0 || !source_->knows(tenant)) return endpoint;

        std::lock_guard<std::mutex> lock(mutex_);
        const Clock::time_point now = now_();
        std::erase_if(entries_, [&now](const auto& entry) { return !(now < entry.second.expires); });
        if (entries_.size() >= capacity_ && !entries_.contains(tenant)) {
            auto oldest = std::min_element(entries_.begin(), entries_.end(), [](const auto& a, const auto& b) {
                return a.second.expires < b.second.expires;
            });
            entries_.erase(oldest);
        }
        entries_.insert_or_assign(tenant, Entry{endpoint, now + ttl_});
        return endpoint;
    }

    size_t CachingDirectory::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }
}
