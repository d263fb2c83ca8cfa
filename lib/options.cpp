#include "options.hpp"

#include <curl/curl.h>

#include <limits>

#include "errors.hpp"

namespace {
    std::string escape(const std::string& value) {
        if (value.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            throw Docker::RequestBuildError("Value too long to percent-encode");
        }
        char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
        if (escaped == nullptr) throw Docker::RequestBuildError("Failed to percent-encode value");
        std::string encoded(escaped);
        curl_free(escaped);
        return encoded;
    }
}

namespace Docker {
    std::string pathSegment(const std::string& id, bool keepSlashes) {
        if (id.empty()) throw RequestBuildError("Resource identifier must not be empty");
        std::string result;
        size_t start = 0;
        while (true) {
            size_t end = keepSlashes ? id.find('/', start) : std::string::npos;
            std::string part = id.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (part == "." || part == "..") {
                throw RequestBuildError("Resource identifier '" + id + "' contains a dot segment");
            }
            result += escape(part);
            if (end == std::string::npos) break;
            result += '/';
            start = end + 1;
        }
        return result;
    }

    std::string urlEncode(const std::string& value) {
        std::string encoded = escape(value);

        // Form encoding writes spaces as '+'.
        std::string result;
        result.reserve(encoded.size());
        for (size_t i = 0; i < encoded.size(); ++i) {
            if (encoded.compare(i, 3, "%20") == 0) {
                result += '+';
                i += 2;
            } else {
                result += encoded[i];
            }
        }
        return result;
    }

    std::string encodeQuery(const std::vector<std::pair<std::string, std::string>>& pairs) {
        std::string query;
        for (const auto& [key, value] : pairs) {
            if (!query.empty()) query += '&';
            query += urlEncode(key) + "=" + urlEncode(value);
        }
        return query;
    }

    std::string withQuery(const std::string& path, const std::optional<std::string>& query) {
        if (!query) return path;
        return path + "?" + *query;
    }

    void Filters::add(const std::string& kind, const std::string& value) {
        lists_[kind].push_back(value);
    }

    void Filters::merge(const FilterMap& raw) {
        for (const auto& [kind, values] : raw) {
            auto& list = lists_[kind];
            list.insert(list.end(), values.begin(), values.end());
        }
    }

    std::string Filters::dump() const {
        return nlohmann::json(lists_).dump();
    }

    std::optional<std::string> QueryOptions::serialize() const {
        if (params_.empty()) return std::nullopt;
        return encodeQuery({params_.begin(), params_.end()});
    }
}
