#ifndef DOCKGATE_ENDPOINT_HPP
#define DOCKGATE_ENDPOINT_HPP

#include <string>

namespace Docker {
    // Address of one daemon: a TCP host/port or a local unix socket.
    class DaemonEndpoint {
    public:
        enum class Kind {tcp, socket};

        static DaemonEndpoint parse(const std::string& address);
        static DaemonEndpoint tcp(const std::string& host, int port, const std::string& scheme = "tcp");
        static DaemonEndpoint local(const std::string& socketPath);

        Kind kind() const { return kind_; }
        const std::string& scheme() const { return scheme_; }
        const std::string& host() const { return host_; }
        int port() const { return port_; }
        const std::string& socketPath() const { return socketPath_; }

        // Base that request paths are joined onto.
        std::string baseUrl() const;
        std::string str() const;

        bool operator==(const DaemonEndpoint& other) const = default;

    private:
        DaemonEndpoint() = default;

        Kind kind_ = Kind::tcp;
        std::string scheme_;
        std::string host_;
        int port_ = 0;
        std::string socketPath_;
    };
}

#endif // DOCKGATE_ENDPOINT_HPP
