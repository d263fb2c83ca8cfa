#ifndef DOCKGATE_VOLUMES_HPP
#define DOCKGATE_VOLUMES_HPP

#include <map>
#include <string>
#include <vector>

#include "endpoint.hpp"
#include "options.hpp"
#include "request.hpp"

namespace Docker {
    class VolumeFilter : public Filter {
    public:
        using Filter::Filter;

        static VolumeFilter dangling(bool dangling = true);
        static VolumeFilter driver(const std::string& driver);
        static VolumeFilter labelName(const std::string& name);
        static VolumeFilter label(const std::string& name, const std::string& value);
        static VolumeFilter name(const std::string& name);
    };

    class VolumeListOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class VolumeListOptionsBuilder : public QueryBuilder<VolumeListOptionsBuilder> {
    public:
        VolumeListOptionsBuilder& filter(const std::vector<VolumeFilter>& filters) { return accumulate(filters); }

        VolumeListOptions build() const { return VolumeListOptions(params_); }
    };

    class VolumeCreateOptions : public JsonOptions {
    public:
        using JsonOptions::JsonOptions;
    };

    class VolumeCreateOptionsBuilder {
        nlohmann::json params_ = nlohmann::json::object();

    public:
        VolumeCreateOptionsBuilder() = default;
        static VolumeCreateOptionsBuilder fromJson(const nlohmann::json& body);

        VolumeCreateOptionsBuilder& name(const std::string& name);
        VolumeCreateOptionsBuilder& driver(const std::string& driver);
        VolumeCreateOptionsBuilder& driverOpts(const std::map<std::string, std::string>& opts);
        VolumeCreateOptionsBuilder& labels(const std::map<std::string, std::string>& labels);

        VolumeCreateOptions build() const { return VolumeCreateOptions(params_); }
    };

    class Volume {
        DaemonEndpoint endpoint_;
        std::string name_;

    public:
        Volume(DaemonEndpoint endpoint, std::string name) : endpoint_(std::move(endpoint)), name_(std::move(name)) {}

        const std::string& name() const { return name_; }

        RequestDescriptor inspect() const;
        // force also removes a volume that is still in use
        RequestDescriptor remove(bool force = false) const;
    };

    class Volumes {
        DaemonEndpoint endpoint_;

    public:
        explicit Volumes(DaemonEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

        RequestDescriptor list(const VolumeListOptions& options = {}) const;
        RequestDescriptor create(const VolumeCreateOptions& options) const;
        Volume get(const std::string& name) const { return {endpoint_, name}; }
    };
}

#endif // DOCKGATE_VOLUMES_HPP
