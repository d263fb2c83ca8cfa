#include "networks.hpp"

#include "errors.hpp"

namespace Docker {
    NetworkFilter NetworkFilter::driver(const std::string& driver) { return {"driver", driver}; }
    NetworkFilter NetworkFilter::id(const std::string& id) { return {"id", id}; }
    NetworkFilter NetworkFilter::labelName(const std::string& name) { return {"label", name}; }
    NetworkFilter NetworkFilter::label(const std::string& name, const std::string& value) { return {"label", name + "=" + value}; }
    NetworkFilter NetworkFilter::name(const std::string& name) { return {"name", name}; }
    NetworkFilter NetworkFilter::scope(const std::string& scope) { return {"scope", scope}; }
    NetworkFilter NetworkFilter::type(const std::string& type) { return {"type", type}; }

    NetworkCreateOptionsBuilder::NetworkCreateOptionsBuilder(const std::string& name) {
        params_["Name"] = name;
    }

    NetworkCreateOptionsBuilder NetworkCreateOptionsBuilder::fromJson(const nlohmann::json& body) {
        if (!body.is_object()) throw RequestBuildError("Network create body must be a JSON object");
        NetworkCreateOptionsBuilder builder;
        builder.params_ = body;
        return builder;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::checkDuplicate(bool check) {
        params_["CheckDuplicate"] = check;
        return *this;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::driver(const std::string& driver) {
        params_["Driver"] = driver;
        return *this;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::internal(bool internal) {
        params_["Internal"] = internal;
        return *this;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::attachable(bool attachable) {
        params_["Attachable"] = attachable;
        return *this;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::ingress(bool ingress) {
        params_["Ingress"] = ingress;
        return *this;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::enableIPv6(bool enable) {
        params_["EnableIPv6"] = enable;
        return *this;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::options(const std::map<std::string, std::string>& options) {
        params_["Options"] = options;
        return *this;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::labels(const std::map<std::string, std::string>& labels) {
        params_["Labels"] = labels;
        return *this;
    }

    NetworkCreateOptionsBuilder& NetworkCreateOptionsBuilder::ipam(const nlohmann::json& ipam) {
        params_["IPAM"] = ipam;
        return *this;
    }

    ContainerConnectionOptionsBuilder::ContainerConnectionOptionsBuilder(const std::string& container) {
        params_["Container"] = container;
    }

    ContainerConnectionOptionsBuilder ContainerConnectionOptionsBuilder::fromJson(const nlohmann::json& body) {
        if (!body.is_object()) throw RequestBuildError("Network connection body must be a JSON object");
        ContainerConnectionOptionsBuilder builder;
        builder.params_ = body;
        return builder;
    }

    nlohmann::json& ContainerConnectionOptionsBuilder::endpointConfig() {
        nlohmann::json& config = params_["EndpointConfig"];
        if (!config.is_object()) config = nlohmann::json::object();
        return config;
    }

    ContainerConnectionOptionsBuilder& ContainerConnectionOptionsBuilder::aliases(const std::vector<std::string>& aliases) {
        endpointConfig()["Aliases"] = aliases;
        return *this;
    }

    ContainerConnectionOptionsBuilder& ContainerConnectionOptionsBuilder::ipv4Address(const std::string& address) {
        endpointConfig()["IPAMConfig"]["IPv4Address"] = address;
        return *this;
    }

    ContainerConnectionOptionsBuilder& ContainerConnectionOptionsBuilder::ipv6Address(const std::string& address) {
        endpointConfig()["IPAMConfig"]["IPv6Address"] = address;
        return *this;
    }

    ContainerConnectionOptionsBuilder& ContainerConnectionOptionsBuilder::force(bool force) {
        params_["Force"] = force;
        return *this;
    }

    RequestDescriptor Network::inspect() const {
        return makeRequest(endpoint_, Method::Get, "/networks/" + pathSegment(id_));
    }

    RequestDescriptor Network::remove() const {
        return makeRequest(endpoint_, Method::Delete, "/networks/" + pathSegment(id_));
    }

    RequestDescriptor Network::connect(const ContainerConnectionOptions& options) const {
        return makeRequest(endpoint_, Method::Post, "/networks/" + pathSegment(id_) + "/connect",
                           Body{options.serialize(), CONTENT_TYPE_JSON});
    }

    RequestDescriptor Network::disconnect(const ContainerConnectionOptions& options) const {
        return makeRequest(endpoint_, Method::Post, "/networks/" + pathSegment(id_) + "/disconnect",
                           Body{options.serialize(), CONTENT_TYPE_JSON});
    }

    RequestDescriptor Networks::list(const NetworkListOptions& options) const {
        return makeRequest(endpoint_, Method::Get, withQuery("/networks", options.serialize()));
    }

    RequestDescriptor Networks::create(const NetworkCreateOptions& options) const {
        return makeRequest(endpoint_, Method::Post, "/networks/create", Body{options.serialize(), CONTENT_TYPE_JSON});
    }
}
