#ifndef DOCKGATE_NETWORKS_HPP
#define DOCKGATE_NETWORKS_HPP

#include <map>
#include <string>
#include <vector>

#include "endpoint.hpp"
#include "options.hpp"
#include "request.hpp"

namespace Docker {
    class NetworkFilter : public Filter {
    public:
        using Filter::Filter;

        static NetworkFilter driver(const std::string& driver);
        static NetworkFilter id(const std::string& id);
        static NetworkFilter labelName(const std::string& name);
        static NetworkFilter label(const std::string& name, const std::string& value);
        static NetworkFilter name(const std::string& name);
        // swarm, global or local
        static NetworkFilter scope(const std::string& scope);
        // custom or builtin
        static NetworkFilter type(const std::string& type);
    };

    class NetworkListOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class NetworkListOptionsBuilder : public QueryBuilder<NetworkListOptionsBuilder> {
    public:
        NetworkListOptionsBuilder& filter(const std::vector<NetworkFilter>& filters) { return accumulate(filters); }

        NetworkListOptions build() const { return NetworkListOptions(params_); }
    };

    class NetworkCreateOptions : public JsonOptions {
    public:
        using JsonOptions::JsonOptions;
    };

    class NetworkCreateOptionsBuilder {
        nlohmann::json params_ = nlohmann::json::object();

        NetworkCreateOptionsBuilder() = default;

    public:
        explicit NetworkCreateOptionsBuilder(const std::string& name);
        static NetworkCreateOptionsBuilder fromJson(const nlohmann::json& body);

        NetworkCreateOptionsBuilder& checkDuplicate(bool check);
        NetworkCreateOptionsBuilder& driver(const std::string& driver);
        NetworkCreateOptionsBuilder& internal(bool internal);
        NetworkCreateOptionsBuilder& attachable(bool attachable);
        NetworkCreateOptionsBuilder& ingress(bool ingress);
        NetworkCreateOptionsBuilder& enableIPv6(bool enable);
        NetworkCreateOptionsBuilder& options(const std::map<std::string, std::string>& options);
        NetworkCreateOptionsBuilder& labels(const std::map<std::string, std::string>& labels);
        // Raw IPAM object: {"Driver": ..., "Config": [{"Subnet": ...}]}
        NetworkCreateOptionsBuilder& ipam(const nlohmann::json& ipam);

        NetworkCreateOptions build() const { return NetworkCreateOptions(params_); }
    };

    // Body of connect and disconnect.
    class ContainerConnectionOptions : public JsonOptions {
    public:
        using JsonOptions::JsonOptions;
    };

    class ContainerConnectionOptionsBuilder {
        nlohmann::json params_ = nlohmann::json::object();

        ContainerConnectionOptionsBuilder() = default;
        nlohmann::json& endpointConfig();

    public:
        explicit ContainerConnectionOptionsBuilder(const std::string& container);
        static ContainerConnectionOptionsBuilder fromJson(const nlohmann::json& body);

        ContainerConnectionOptionsBuilder& aliases(const std::vector<std::string>& aliases);
        ContainerConnectionOptionsBuilder& ipv4Address(const std::string& address);
        ContainerConnectionOptionsBuilder& ipv6Address(const std::string& address);
        // Only meaningful on disconnect
        ContainerConnectionOptionsBuilder& force(bool force);

        ContainerConnectionOptions build() const { return ContainerConnectionOptions(params_); }
    };

    class Network {
        DaemonEndpoint endpoint_;
        std::string id_;

    public:
        Network(DaemonEndpoint endpoint, std::string id) : endpoint_(std::move(endpoint)), id_(std::move(id)) {}

        const std::string& id() const { return id_; }

        RequestDescriptor inspect() const;
        RequestDescriptor remove() const;
        RequestDescriptor connect(const ContainerConnectionOptions& options) const;
        RequestDescriptor disconnect(const ContainerConnectionOptions& options) const;
    };

    class Networks {
        DaemonEndpoint endpoint_;

    public:
        explicit Networks(DaemonEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

        RequestDescriptor list(const NetworkListOptions& options = {}) const;
        RequestDescriptor create(const NetworkCreateOptions& options) const;
        Network get(const std::string& id) const { return {endpoint_, id}; }
    };
}

#endif // DOCKGATE_NETWORKS_HPP
