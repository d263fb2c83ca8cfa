#include <gtest/gtest.h>

#include <stdexcept>

#include "lib/endpoint.hpp"

using Docker::DaemonEndpoint;

TEST(EndpointTest, DefaultPortsPerScheme) {
    EXPECT_EQ(DaemonEndpoint::parse("tcp://10.0.0.5").port(), 2375);
    EXPECT_EQ(DaemonEndpoint::parse("http://docker.internal").port(), 80);
    EXPECT_EQ(DaemonEndpoint::parse("https://docker.internal").port(), 443);
}

TEST(EndpointTest, ExplicitPortAndTrailingPath) {
    auto endpoint = DaemonEndpoint::parse("tcp://10.0.0.5:2376/ignored");
    EXPECT_EQ(endpoint.kind(), DaemonEndpoint::Kind::tcp);
    EXPECT_EQ(endpoint.scheme(), "tcp");
    EXPECT_EQ(endpoint.host(), "10.0.0.5");
    EXPECT_EQ(endpoint.port(), 2376);
    EXPECT_EQ(endpoint.baseUrl(), "tcp://10.0.0.5:2376");
    EXPECT_EQ(endpoint, DaemonEndpoint::tcp("10.0.0.5", 2376));
}

TEST(EndpointTest, BracketedIpv6) {
    auto endpoint = DaemonEndpoint::parse("http://[::1]:8010");
    EXPECT_EQ(endpoint.host(), "[::1]");
    EXPECT_EQ(endpoint.port(), 8010);
    EXPECT_EQ(endpoint.str(), "http://[::1]:8010");
}

TEST(EndpointTest, UnixSocket) {
    auto endpoint = DaemonEndpoint::parse("unix:///var/run/docker.sock");
    EXPECT_EQ(endpoint.kind(), DaemonEndpoint::Kind::socket);
    EXPECT_EQ(endpoint.socketPath(), "/var/run/docker.sock");
    EXPECT_EQ(endpoint.baseUrl(), "http://localhost");
    EXPECT_EQ(endpoint.str(), "unix:///var/run/docker.sock");
}

TEST(EndpointTest, RejectsMalformedAddresses) {
    EXPECT_THROW(DaemonEndpoint::parse("10.0.0.5:2375"), std::runtime_error);
    EXPECT_THROW(DaemonEndpoint::parse("ftp://10.0.0.5"), std::runtime_error);
    EXPECT_THROW(DaemonEndpoint::parse("tcp://10.0.0.5:http"), std::runtime_error);
    EXPECT_THROW(DaemonEndpoint::parse("tcp://10.0.0.5:70000"), std::runtime_error);
    EXPECT_THROW(DaemonEndpoint::parse("tcp://:2375"), std::runtime_error);
    EXPECT_THROW(DaemonEndpoint::parse("unix://docker.sock"), std::runtime_error);
}
