#include "volumes.hpp"

#include "errors.hpp"

namespace Docker {
    VolumeFilter VolumeFilter::dangling(bool dangling) { return {"dangling", dangling ? "true" : "false"}; }
    VolumeFilter VolumeFilter::driver(const std::string& driver) { return {"driver", driver}; }
    VolumeFilter VolumeFilter::labelName(const std::string& name) { return {"label", name}; }
    VolumeFilter VolumeFilter::label(const std::string& name, const std::string& value) { return {"label", name + "=" + value}; }
    VolumeFilter VolumeFilter::name(const std::string& name) { return {"name", name}; }

    VolumeCreateOptionsBuilder VolumeCreateOptionsBuilder::fromJson(const nlohmann::json& body) {
        if (!body.is_object()) throw RequestBuildError("Volume create body must be a JSON object");
        VolumeCreateOptionsBuilder builder;
        builder.params_ = body;
        return builder;
    }

    VolumeCreateOptionsBuilder& VolumeCreateOptionsBuilder::name(const std::string& name) {
        params_["Name"] = name;
        return *this;
    }

    VolumeCreateOptionsBuilder& VolumeCreateOptionsBuilder::driver(const std::string& driver) {
        params_["Driver"] = driver;
        return *this;
    }

    VolumeCreateOptionsBuilder& VolumeCreateOptionsBuilder::driverOpts(const std::map<std::string, std::string>& opts) {
        params_["DriverOpts"] = opts;
        return *this;
    }

    VolumeCreateOptionsBuilder& VolumeCreateOptionsBuilder::labels(const std::map<std::string, std::string>& labels) {
        params_["Labels"] = labels;
        return *this;
    }

    RequestDescriptor Volume::inspect() const {
        return makeRequest(endpoint_, Method::Get, "/volumes/" + pathSegment(name_));
    }

    RequestDescriptor Volume::remove(bool force) const {
        std::optional<std::string> query;
        if (force) query = encodeQuery({{"force", "true"}});
        return makeRequest(endpoint_, Method::Delete, withQuery("/volumes/" + pathSegment(name_), query));
    }

    RequestDescriptor Volumes::list(const VolumeListOptions& options) const {
        return makeRequest(endpoint_, Method::Get, withQuery("/volumes", options.serialize()));
    }

    RequestDescriptor Volumes::create(const VolumeCreateOptions& options) const {
        return makeRequest(endpoint_, Method::Post, "/volumes/create", Body{options.serialize(), CONTENT_TYPE_JSON});
    }
}
