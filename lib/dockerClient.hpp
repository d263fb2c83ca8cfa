#ifndef DOCKGATE_DOCKER_CLIENT_HPP
#define DOCKGATE_DOCKER_CLIENT_HPP

#include <string>
#include <vector>

#include "containers.hpp"
#include "endpoint.hpp"
#include "images.hpp"
#include "networks.hpp"
#include "options.hpp"
#include "request.hpp"
#include "services.hpp"
#include "volumes.hpp"

namespace Docker {
    class EventFilter : public Filter {
    public:
        using Filter::Filter;

        static EventFilter container(const std::string& container);
        // e.g. start, stop, die, pull, create
        static EventFilter event(const std::string& event);
        static EventFilter image(const std::string& image);
        static EventFilter labelName(const std::string& name);
        static EventFilter label(const std::string& name, const std::string& value);
        // container, image, volume, network, daemon, plugin, node, service, secret or config
        static EventFilter type(const std::string& type);
        static EventFilter volume(const std::string& volume);
        static EventFilter network(const std::string& network);
        static EventFilter daemon(const std::string& daemon);
    };

    class EventsOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class EventsOptionsBuilder : public QueryBuilder<EventsOptionsBuilder> {
    public:
        EventsOptionsBuilder& since(int64_t timestamp) { return setNumber("since", timestamp); }
        EventsOptionsBuilder& until(int64_t timestamp) { return setNumber("until", timestamp); }
        EventsOptionsBuilder& filter(const std::vector<EventFilter>& filters) { return accumulate(filters); }

        EventsOptions build() const { return EventsOptions(params_); }
    };

    // Entry point of the request-construction API for one daemon.
    // Every method returns a descriptor; nothing here touches the network.
    class Client {
        DaemonEndpoint endpoint_;

    public:
        explicit Client(DaemonEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

        const DaemonEndpoint& endpoint() const { return endpoint_; }

        Images images() const { return Images(endpoint_); }
        Containers containers() const { return Containers(endpoint_); }
        Volumes volumes() const { return Volumes(endpoint_); }
        Networks networks() const { return Networks(endpoint_); }
        Services services() const { return Services(endpoint_); }

        RequestDescriptor version() const;
        RequestDescriptor info() const;
        RequestDescriptor ping() const;
        RequestDescriptor events(const EventsOptions& options = {}) const;
    };
}

#endif // DOCKGATE_DOCKER_CLIENT_HPP
