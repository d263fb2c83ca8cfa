#include "images.hpp"

#include "tar.hpp"

namespace Docker {
    namespace {
        HeaderList authHeaders(const std::optional<std::string>& auth) {
            if (!auth) return {};
            return {{REGISTRY_AUTH_HEADER, *auth}};
        }
    }

    ImageFilter ImageFilter::dangling(bool dangling) { return {"dangling", dangling ? "true" : "false"}; }
    ImageFilter ImageFilter::labelName(const std::string& name) { return {"label", name}; }
    ImageFilter ImageFilter::label(const std::string& name, const std::string& value) { return {"label", name + "=" + value}; }
    ImageFilter ImageFilter::before(const std::string& image) { return {"before", image}; }
    ImageFilter ImageFilter::since(const std::string& image) { return {"since", image}; }
    ImageFilter ImageFilter::reference(const std::string& reference) { return {"reference", reference}; }

    BuildOptionsBuilder& BuildOptionsBuilder::buildArgs(const std::map<std::string, std::string>& args) {
        return set("buildargs", nlohmann::json(args).dump());
    }

    BuildOptionsBuilder& BuildOptionsBuilder::labels(const std::map<std::string, std::string>& labels) {
        return set("labels", nlohmann::json(labels).dump());
    }

    std::optional<std::string> PullOptions::authHeader() const {
        if (!auth_) return std::nullopt;
        return auth_->serialize();
    }

    PullOptionsBuilder& PullOptionsBuilder::auth(const RegistryAuth& auth) {
        auth_ = auth;
        return *this;
    }

    std::optional<std::string> PushOptions::authHeader() const {
        if (!auth_) return std::nullopt;
        return auth_->serialize();
    }

    PushOptionsBuilder& PushOptionsBuilder::auth(const RegistryAuth& auth) {
        auth_ = auth;
        return *this;
    }

    RequestDescriptor Image::inspect() const {
        return makeRequest(endpoint_, Method::Get, "/images/" + pathSegment(name_, true) + "/json");
    }

    RequestDescriptor Image::history() const {
        return makeRequest(endpoint_, Method::Get, "/images/" + pathSegment(name_, true) + "/history");
    }

    RequestDescriptor Image::remove(const RmImageOptions& options) const {
        return makeRequest(endpoint_, Method::Delete, withQuery("/images/" + pathSegment(name_, true), options.serialize()));
    }

    RequestDescriptor Image::exportImage() const {
        return makeRequest(endpoint_, Method::Get, "/images/" + pathSegment(name_, true) + "/get");
    }

    RequestDescriptor Image::tag(const TagOptions& options) const {
        return makeRequest(endpoint_, Method::Post, withQuery("/images/" + pathSegment(name_, true) + "/tag", options.serialize()));
    }

    RequestDescriptor Image::push(const PushOptions& options) const {
        return makeRequest(endpoint_, Method::Post, withQuery("/images/" + pathSegment(name_, true) + "/push", options.serialize()),
                           std::nullopt, authHeaders(options.authHeader()));
    }

    RequestDescriptor Images::build(const BuildOptions& options) const {
        return makeRequest(endpoint_, Method::Post, withQuery("/build", options.serialize()),
                           Body{tarDirectory(options.path()), CONTENT_TYPE_TAR});
    }

    RequestDescriptor Images::list(const ImageListOptions& options) const {
        return makeRequest(endpoint_, Method::Get, withQuery("/images/json", options.serialize()));
    }

    RequestDescriptor Images::search(const std::string& term, std::optional<int> limit) const {
        std::vector<std::pair<std::string, std::string>> query{{"term", term}};
        if (limit) query.emplace_back("limit", std::to_string(*limit));
        return makeRequest(endpoint_, Method::Get, withQuery("/images/search", encodeQuery(query)));
    }

    RequestDescriptor Images::pull(const PullOptions& options) const {
        return makeRequest(endpoint_, Method::Post, withQuery("/images/create", options.serialize()),
                           std::nullopt, authHeaders(options.authHeader()));
    }

    RequestDescriptor Images::exportImages(const std::vector<std::string>& names) const {
        std::vector<std::pair<std::string, std::string>> query;
        for (const auto& name : names) query.emplace_back("names", name);
        std::optional<std::string> encoded;
        if (!query.empty()) encoded = encodeQuery(query);
        return makeRequest(endpoint_, Method::Get, withQuery("/images/get", encoded));
    }

    RequestDescriptor Images::import(std::string tarball) const {
        return makeRequest(endpoint_, Method::Post, "/images/load", Body{std::move(tarball), CONTENT_TYPE_TAR});
    }
}
