#include "request.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

#include "errors.hpp"

namespace {
    struct UrlDeleter {
        void operator()(CURLU* url) const { curl_url_cleanup(url); }
    };

    using UrlHandle = std::unique_ptr<CURLU, UrlDeleter>;

    // The daemon schemes (tcp, unix) are not ones libcurl speaks itself.
    constexpr unsigned int URL_FLAGS = CURLU_NON_SUPPORT_SCHEME;

    void setUrl(CURLU* url, const std::string& value) {
        CURLUcode rc = curl_url_set(url, CURLUPART_URL, value.c_str(), URL_FLAGS);
        if (rc != CURLUE_OK) {
            throw Docker::RequestBuildError("Cannot build URL from '" + value + "': " + curl_url_strerror(rc));
        }
    }

    std::string getPart(CURLU* url, CURLUPart part) {
        char* value = nullptr;
        CURLUcode rc = curl_url_get(url, part, &value, 0);
        if (rc == CURLUE_NO_QUERY) return "";
        if (rc != CURLUE_OK) {
            throw Docker::RequestBuildError(std::string("Cannot read back request URL: ") + curl_url_strerror(rc));
        }
        std::string result(value);
        curl_free(value);
        return result;
    }
}

namespace Docker {
    const std::string CONTENT_TYPE_JSON = "application/json";
    const std::string CONTENT_TYPE_TAR = "application/tar";
    const std::string REGISTRY_AUTH_HEADER = "X-Registry-Auth";

    bool sameHeader(const std::string& a, const std::string& b) {
        return !CaseInsensitiveLess{}(a, b) && !CaseInsensitiveLess{}(b, a);
    }

    std::string methodName(const Method method) {
        switch (method) {
            case Method::Get: return "GET";
            case Method::Head: return "HEAD";
            case Method::Post: return "POST";
            case Method::Put: return "PUT";
            case Method::Patch: return "PATCH";
            case Method::Delete: return "DELETE";
        }
        return "GET";
    }

    bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
    }

    RequestDescriptor::RequestDescriptor(Method method, std::string url, std::string target, DaemonEndpoint endpoint,
                                         Headers headers, std::optional<Body> body)
        : method_(method), url_(std::move(url)), target_(std::move(target)), endpoint_(std::move(endpoint)),
          headers_(std::move(headers)), body_(std::move(body)) {}

    std::string RequestDescriptor::describe() const {
        std::ostringstream stream;
        stream << methodName(method_) << ' ' << url_;
        if (endpoint_.kind() == DaemonEndpoint::Kind::socket) stream << " via " << endpoint_.str();
        for (const auto& [name, value] : headers_) {
            stream << " [" << name << ": " << (sameHeader(name, REGISTRY_AUTH_HEADER) ? "<redacted>" : value) << ']';
        }
        if (body_) stream << " body " << body_->data.size() << " bytes";
        return stream.str();
    }

    RequestDescriptor makeRequest(const DaemonEndpoint& endpoint, Method method, const std::string& path,
                                  std::optional<Body> body, const HeaderList& headers) {
        UrlHandle url(curl_url());
        if (!url) throw RequestBuildError("Failed to allocate URL handle");

        setUrl(url.get(), endpoint.baseUrl());
        // A relative reference is resolved against the base already held by the handle.
        setUrl(url.get(), path);

        std::string absolute = getPart(url.get(), CURLUPART_URL);
        std::string target = getPart(url.get(), CURLUPART_PATH);
        std::string query = getPart(url.get(), CURLUPART_QUERY);
        if (!query.empty()) target += "?" + query;

        Headers merged;
        for (const auto& [name, value] : headers) {
            merged.erase(name);
            merged.emplace(name, value);
        }
        if (body) {
            merged.erase("Content-Type");
            merged.emplace("Content-Type", body->contentType);
        }

        return {method, std::move(absolute), std::move(target), endpoint, std::move(merged), std::move(body)};
    }
}
