#include "endpoint.hpp"

#include <map>
#include <stdexcept>

namespace {
    const std::map<std::string, int> DEFAULT_PORTS = {
        {"tcp", 2375},
        {"http", 80},
        {"https", 443}
    };

    int parsePort(const std::string& value, const std::string& address) {
        try {
            size_t consumed = 0;
            int port = std::stoi(value, &consumed);
            if (consumed != value.size() || port <= 0 || port > 65535) {
                throw std::out_of_range(value);
            }
            return port;
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid port in daemon address: " + address);
        }
    }
}

namespace Docker {
    DaemonEndpoint DaemonEndpoint::parse(const std::string& address) {
        size_t pos = address.find("://");
        if (pos == std::string::npos) throw std::runtime_error("Invalid daemon address: " + address);
        std::string scheme = address.substr(0, pos);
        std::string rest = address.substr(pos + 3);

        if (scheme == "unix") {
            if (rest.empty() || rest.front() != '/') {
                throw std::runtime_error("Unix daemon address must carry an absolute socket path: " + address);
            }
            return local(rest);
        }
        if (!DEFAULT_PORTS.contains(scheme)) {
            throw std::runtime_error("Unsupported daemon scheme '" + scheme + "' in " + address);
        }

        // Anything after the authority is ignored; request paths are absolute.
        pos = rest.find('/');
        std::string hostPort = pos == std::string::npos ? rest : rest.substr(0, pos);

        std::string host, port;
        if (!hostPort.empty() && hostPort.front() == '[') {
            size_t close = hostPort.find(']');
            if (close == std::string::npos) throw std::runtime_error("Invalid daemon address: " + address);
            host = hostPort.substr(0, close + 1);
            if (close + 1 < hostPort.size()) {
                if (hostPort[close + 1] != ':') throw std::runtime_error("Invalid daemon address: " + address);
                port = hostPort.substr(close + 2);
            }
        } else {
            pos = hostPort.find(':');
            host = pos == std::string::npos ? hostPort : hostPort.substr(0, pos);
            if (pos != std::string::npos) port = hostPort.substr(pos + 1);
        }
        if (host.empty()) throw std::runtime_error("Daemon address has no host: " + address);

        return tcp(host, port.empty() ? DEFAULT_PORTS.at(scheme) : parsePort(port, address), scheme);
    }

    DaemonEndpoint DaemonEndpoint::tcp(const std::string& host, int port, const std::string& scheme) {
        DaemonEndpoint endpoint;
        endpoint.kind_ = Kind::tcp;
        endpoint.scheme_ = scheme;
        endpoint.host_ = host;
        endpoint.port_ = port;
        return endpoint;
    }

    DaemonEndpoint DaemonEndpoint::local(const std::string& socketPath) {
        DaemonEndpoint endpoint;
        endpoint.kind_ = Kind::socket;
        endpoint.scheme_ = "unix";
        endpoint.socketPath_ = socketPath;
        return endpoint;
    }

    std::string DaemonEndpoint::baseUrl() const {
        if (kind_ == Kind::socket) return "http://localhost";
        return scheme_ + "://" + host_ + ":" + std::to_string(port_);
    }

    std::string DaemonEndpoint::str() const {
        if (kind_ == Kind::socket) return "unix://" + socketPath_;
        return baseUrl();
    }
}
