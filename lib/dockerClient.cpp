#include "dockerClient.hpp"

namespace Docker {
    EventFilter EventFilter::container(const std::string& container) { return {"container", container}; }
    EventFilter EventFilter::event(const std::string& event) { return {"event", event}; }
    EventFilter EventFilter::image(const std::string& image) { return {"image", image}; }
    EventFilter EventFilter::labelName(const std::string& name) { return {"label", name}; }
    EventFilter EventFilter::label(const std::string& name, const std::string& value) { return {"label", name + "=" + value}; }
    EventFilter EventFilter::type(const std::string& type) { return {"type", type}; }
    EventFilter EventFilter::volume(const std::string& volume) { return {"volume", volume}; }
    EventFilter EventFilter::network(const std::string& network) { return {"network", network}; }
    EventFilter EventFilter::daemon(const std::string& daemon) { return {"daemon", daemon}; }

    RequestDescriptor Client::version() const {
        return makeRequest(endpoint_, Method::Get, "/version");
    }

    RequestDescriptor Client::info() const {
        return makeRequest(endpoint_, Method::Get, "/info");
    }

    RequestDescriptor Client::ping() const {
        return makeRequest(endpoint_, Method::Get, "/_ping");
    }

    RequestDescriptor Client::events(const EventsOptions& options) const {
        return makeRequest(endpoint_, Method::Get, withQuery("/events", options.serialize()));
    }
}
