#ifndef DOCKGATE_OPTIONS_HPP
#define DOCKGATE_OPTIONS_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Docker {
    // How an options value travels to the daemon.
    enum class Encoding {query, json};

    using FilterMap = std::map<std::string, std::vector<std::string>>;

    std::string urlEncode(const std::string& value);
    // Percent-encodes an identifier for use inside a request path. With keepSlashes each
    // '/'-separated part is encoded on its own (image names). Empty ids and dot segments throw.
    std::string pathSegment(const std::string& id, bool keepSlashes = false);
    std::string encodeQuery(const std::vector<std::pair<std::string, std::string>>& pairs);
    std::string withQuery(const std::string& path, const std::optional<std::string>& query);

    // One typed filter entry; resource headers derive named constructors from it.
    class Filter {
        std::string kind_;
        std::string value_;

    public:
        Filter(std::string kind, std::string value) : kind_(std::move(kind)), value_(std::move(value)) {}

        const std::string& kind() const { return kind_; }
        const std::string& value() const { return value_; }
    };

    // Per-kind filter lists, kept across filter() calls on one builder.
    class Filters {
        FilterMap lists_;

    public:
        void add(const std::string& kind, const std::string& value);
        void merge(const FilterMap& raw);
        bool empty() const { return lists_.empty(); }
        const FilterMap& lists() const { return lists_; }
        std::string dump() const;
    };

    class QueryOptions {
    protected:
        std::map<std::string, std::string> params_;

    public:
        static constexpr Encoding encoding = Encoding::query;

        QueryOptions() = default;
        explicit QueryOptions(std::map<std::string, std::string> params) : params_(std::move(params)) {}

        // std::nullopt when nothing was set.
        std::optional<std::string> serialize() const;
        const std::map<std::string, std::string>& params() const { return params_; }
    };

    class JsonOptions {
    protected:
        nlohmann::json params_ = nlohmann::json::object();

    public:
        static constexpr Encoding encoding = Encoding::json;

        JsonOptions() = default;
        explicit JsonOptions(nlohmann::json params) : params_(std::move(params)) {}

        std::string serialize() const { return params_.dump(); }
        const nlohmann::json& params() const { return params_; }
    };

    template<typename Self>
    class QueryBuilder {
    protected:
        std::map<std::string, std::string> params_;
        Filters filters_;

        Self& self() { return static_cast<Self&>(*this); }

        Self& set(const std::string& key, const std::string& value) {
            params_[key] = value;
            return self();
        }

        Self& setFlag(const std::string& key, bool value) {
            return set(key, value ? "true" : "false");
        }

        Self& setNumber(const std::string& key, int64_t value) {
            return set(key, std::to_string(value));
        }

        // The stored value always reflects every filter seen so far.
        Self& storeFilters() {
            if (!filters_.empty()) params_["filters"] = filters_.dump();
            return self();
        }

        template<typename F>
        Self& accumulate(const std::vector<F>& filters) {
            for (const Filter& filter : filters) filters_.add(filter.kind(), filter.value());
            return storeFilters();
        }

    public:
        // Filters in the daemon's own JSON shape, e.g. taken from an inbound request.
        Self& rawFilters(const FilterMap& raw) {
            filters_.merge(raw);
            return storeFilters();
        }
    };
}

#endif // DOCKGATE_OPTIONS_HPP
