#pragma once

#include <httplib.h>

#include <functional>
#include <memory>
#include <string>

#include "directory.hpp"
#include "lib/dockerClient.hpp"
#include "relay.hpp"
#include "transport.hpp"

namespace Gateway {
    // Builds the outbound request for one inbound route.
    using Operation = std::function<Docker::RequestDescriptor(const Docker::Client&, const httplib::Request&)>;

    // HTTP front end: /{tenant}/... routes resolved, rebuilt for the tenant's daemon and relayed.
    class Server {
        std::shared_ptr<const Directory> directory_;
        std::shared_ptr<const Transport> transport_;
        bool verbose_;
        httplib::Server server_;

        void route(Docker::Method method, const std::string& pattern, Operation operation);
        void registerSystemRoutes();
        void registerContainerRoutes();
        void registerImageRoutes();
        void registerVolumeRoutes();
        void registerNetworkRoutes();
        void registerServiceRoutes();

        void handle(const httplib::Request& req, httplib::Response& res, const Operation& operation) const;

    public:
        Server(std::shared_ptr<const Directory> directory, std::shared_ptr<const Transport> transport, bool verbose = false);

        bool listen(const std::string& host, int port);
        // Binds to a free port and returns it; serve with listenAfterBind().
        int bindToAnyPort(const std::string& host);
        bool listenAfterBind();
        bool isRunning() const { return server_.is_running(); }
        void waitUntilReady() const { server_.wait_until_ready(); }
        void stop();
    };

    // JSON error body shared by every failure response.
    void fail(httplib::Response& res, int status, const std::string& message, const std::string& path);
}
