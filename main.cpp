#include <iostream>
#include <memory>

#include "config.hpp"
#include "gateway.hpp"
#include "gatewayErrors.hpp"
#include "lib/dockerClient.hpp"
#include "lib/errors.hpp"
#include "transport.hpp"

namespace {
    // Startup check only; an unreachable daemon is reported but does not stop the gateway.
    void probe(const std::string& tenant, const std::string& address, const Gateway::Transport& transport) {
        try {
            Docker::Client client(Docker::DaemonEndpoint::parse(address));
            Docker::RequestDescriptor ping = client.ping();
            Gateway::expectSuccess(transport.send(ping), ping);
            std::cout << "Daemon for " << tenant << " is up: " << client.endpoint().str() << std::endl;
        } catch (const Gateway::TransportError& e) {
            std::cerr << "Daemon for " << tenant << " is unreachable: " << e.what() << std::endl;
        } catch (const Docker::UpstreamError& e) {
            std::cerr << "Daemon for " << tenant << " is unhealthy: " << e.what() << std::endl;
        }
    }
}

int main() {
    try {
        Gateway::Config config = Gateway::Config::load();
        auto directory = config.makeDirectory();
        auto transport = std::make_shared<Gateway::HttplibTransport>(config.connectTimeout, config.readTimeout);

        for (const auto& [tenant, address] : config.daemons) probe(tenant, address, *transport);
        if (config.defaultDaemon) probe("<default>", *config.defaultDaemon, *transport);
        if (config.daemons.empty() && !config.defaultDaemon) {
            std::cerr << "No daemons configured; every request will be rejected" << std::endl;
        }

        Gateway::Server server(directory, transport, config.verbose);
        std::cout << "Listening on " << config.host << ':' << config.port << std::endl;
        if (!server.listen(config.host, config.port)) {
            std::cerr << "Cannot listen on " << config.host << ':' << config.port << std::endl;
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unhandled exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "Unhandled unknown exception" << std::endl;
        return 1;
    }
}
