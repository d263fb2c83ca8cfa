#include "services.hpp"

#include "errors.hpp"

namespace Docker {
    namespace {
        HeaderList authHeaders(const std::optional<std::string>& auth) {
            if (!auth) return {};
            return {{REGISTRY_AUTH_HEADER, *auth}};
        }
    }

    ServiceFilter ServiceFilter::id(const std::string& id) { return {"id", id}; }
    ServiceFilter ServiceFilter::labelName(const std::string& name) { return {"label", name}; }
    ServiceFilter ServiceFilter::label(const std::string& name, const std::string& value) { return {"label", name + "=" + value}; }
    ServiceFilter ServiceFilter::mode(const std::string& mode) { return {"mode", mode}; }
    ServiceFilter ServiceFilter::name(const std::string& name) { return {"name", name}; }

    std::optional<std::string> ServiceOptions::authHeader() const {
        if (!auth_) return std::nullopt;
        return auth_->serialize();
    }

    ServiceOptionsBuilder::ServiceOptionsBuilder(const std::string& name) {
        params_["Name"] = name;
    }

    ServiceOptionsBuilder ServiceOptionsBuilder::fromJson(const nlohmann::json& body) {
        if (!body.is_object()) throw RequestBuildError("Service spec must be a JSON object");
        ServiceOptionsBuilder builder;
        builder.params_ = body;
        return builder;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::name(const std::string& name) {
        params_["Name"] = name;
        return *this;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::labels(const std::map<std::string, std::string>& labels) {
        params_["Labels"] = labels;
        return *this;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::image(const std::string& image) {
        params_["TaskTemplate"]["ContainerSpec"]["Image"] = image;
        return *this;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::taskTemplate(const nlohmann::json& spec) {
        params_["TaskTemplate"] = spec;
        return *this;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::replicas(uint64_t replicas) {
        params_["Mode"] = {{"Replicated", {{"Replicas", replicas}}}};
        return *this;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::global() {
        params_["Mode"] = {{"Global", nlohmann::json::object()}};
        return *this;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::updateConfig(const nlohmann::json& config) {
        params_["UpdateConfig"] = config;
        return *this;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::endpointSpec(const nlohmann::json& spec) {
        params_["EndpointSpec"] = spec;
        return *this;
    }

    ServiceOptionsBuilder& ServiceOptionsBuilder::auth(const RegistryAuth& auth) {
        auth_ = auth;
        return *this;
    }

    RequestDescriptor Service::inspect() const {
        return makeRequest(endpoint_, Method::Get, "/services/" + pathSegment(id_));
    }

    RequestDescriptor Service::remove() const {
        return makeRequest(endpoint_, Method::Delete, "/services/" + pathSegment(id_));
    }

    RequestDescriptor Service::update(uint64_t version, const ServiceOptions& options) const {
        return makeRequest(endpoint_, Method::Post,
                           withQuery("/services/" + pathSegment(id_) + "/update", encodeQuery({{"version", std::to_string(version)}})),
                           Body{options.serialize(), CONTENT_TYPE_JSON}, authHeaders(options.authHeader()));
    }

    RequestDescriptor Service::logs(const LogsOptions& options) const {
        return makeRequest(endpoint_, Method::Get, withQuery("/services/" + pathSegment(id_) + "/logs", options.serialize()));
    }

    RequestDescriptor Services::list(const ServiceListOptions& options) const {
        return makeRequest(endpoint_, Method::Get, withQuery("/services", options.serialize()));
    }

    RequestDescriptor Services::create(const ServiceOptions& options) const {
        return makeRequest(endpoint_, Method::Post, "/services/create", Body{options.serialize(), CONTENT_TYPE_JSON},
                           authHeaders(options.authHeader()));
    }
}
