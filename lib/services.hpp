#ifndef DOCKGATE_SERVICES_HPP
#define DOCKGATE_SERVICES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "containers.hpp"
#include "endpoint.hpp"
#include "options.hpp"
#include "registryAuth.hpp"
#include "request.hpp"

namespace Docker {
    class ServiceFilter : public Filter {
    public:
        using Filter::Filter;

        static ServiceFilter id(const std::string& id);
        static ServiceFilter labelName(const std::string& name);
        static ServiceFilter label(const std::string& name, const std::string& value);
        // replicated or global
        static ServiceFilter mode(const std::string& mode);
        static ServiceFilter name(const std::string& name);
    };

    class ServiceListOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class ServiceListOptionsBuilder : public QueryBuilder<ServiceListOptionsBuilder> {
    public:
        // Include running and desired task counts
        ServiceListOptionsBuilder& status(bool status) { return setFlag("status", status); }
        ServiceListOptionsBuilder& filter(const std::vector<ServiceFilter>& filters) { return accumulate(filters); }

        ServiceListOptions build() const { return ServiceListOptions(params_); }
    };

    // Service spec for create and update, with optional registry credentials.
    class ServiceOptions : public JsonOptions {
        std::optional<RegistryAuth> auth_;

    public:
        ServiceOptions(nlohmann::json params, std::optional<RegistryAuth> auth)
            : JsonOptions(std::move(params)), auth_(std::move(auth)) {}

        std::optional<std::string> authHeader() const;
    };

    class ServiceOptionsBuilder {
        nlohmann::json params_ = nlohmann::json::object();
        std::optional<RegistryAuth> auth_;

        ServiceOptionsBuilder() = default;

    public:
        explicit ServiceOptionsBuilder(const std::string& name);
        static ServiceOptionsBuilder fromJson(const nlohmann::json& body);

        ServiceOptionsBuilder& name(const std::string& name);
        ServiceOptionsBuilder& labels(const std::map<std::string, std::string>& labels);
        // Shorthand for TaskTemplate.ContainerSpec.Image
        ServiceOptionsBuilder& image(const std::string& image);
        ServiceOptionsBuilder& taskTemplate(const nlohmann::json& spec);
        ServiceOptionsBuilder& replicas(uint64_t replicas);
        ServiceOptionsBuilder& global();
        ServiceOptionsBuilder& updateConfig(const nlohmann::json& config);
        ServiceOptionsBuilder& endpointSpec(const nlohmann::json& spec);
        ServiceOptionsBuilder& auth(const RegistryAuth& auth);

        ServiceOptions build() const { return {params_, auth_}; }
    };

    class Service {
        DaemonEndpoint endpoint_;
        std::string id_;

    public:
        Service(DaemonEndpoint endpoint, std::string id) : endpoint_(std::move(endpoint)), id_(std::move(id)) {}

        const std::string& id() const { return id_; }

        RequestDescriptor inspect() const;
        RequestDescriptor remove() const;
        // version is the spec version read from inspect, guarding against concurrent updates
        RequestDescriptor update(uint64_t version, const ServiceOptions& options) const;
        RequestDescriptor logs(const LogsOptions& options = {}) const;
    };

    class Services {
        DaemonEndpoint endpoint_;

    public:
        explicit Services(DaemonEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

        RequestDescriptor list(const ServiceListOptions& options = {}) const;
        RequestDescriptor create(const ServiceOptions& options) const;
        Service get(const std::string& id) const { return {endpoint_, id}; }
    };
}

#endif // DOCKGATE_SERVICES_HPP
