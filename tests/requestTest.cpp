#include <gtest/gtest.h>

#include "lib/errors.hpp"
#include "lib/request.hpp"

using namespace Docker;

namespace {
    const DaemonEndpoint DAEMON = DaemonEndpoint::parse("tcp://10.0.0.5:2375");
}

TEST(RequestTest, JoinsPathOntoEndpoint) {
    auto request = makeRequest(DAEMON, Method::Get, "/containers/json?all=true");
    EXPECT_EQ(request.url(), "tcp://10.0.0.5:2375/containers/json?all=true");
    EXPECT_EQ(request.target(), "/containers/json?all=true");
    EXPECT_EQ(request.endpoint(), DAEMON);
    EXPECT_FALSE(request.body().has_value());
}

TEST(RequestTest, MethodIsPassedThrough) {
    for (Method method : {Method::Get, Method::Head, Method::Post, Method::Put, Method::Patch, Method::Delete}) {
        EXPECT_EQ(makeRequest(DAEMON, method, "/_ping").method(), method);
    }
    EXPECT_EQ(methodName(Method::Delete), "DELETE");
    EXPECT_EQ(methodName(Method::Patch), "PATCH");
}

TEST(RequestTest, ContentTypeOnlyWithBody) {
    auto bare = makeRequest(DAEMON, Method::Post, "/containers/abc/start");
    EXPECT_EQ(bare.headers().count("Content-Type"), 0u);

    auto withBody = makeRequest(DAEMON, Method::Post, "/volumes/create", Body{"{}", CONTENT_TYPE_JSON},
                                {{"content-type", "text/plain"}});
    ASSERT_EQ(withBody.headers().count("Content-Type"), 1u);
    EXPECT_EQ(withBody.headers().at("Content-Type"), "application/json");
    EXPECT_EQ(withBody.body()->data, "{}");
}

TEST(RequestTest, HeadersLastWriteWinsIgnoringCase) {
    auto request = makeRequest(DAEMON, Method::Get, "/info", std::nullopt,
                               {{"X-Trace", "1"}, {"Accept", "*/*"}, {"x-trace", "2"}});
    EXPECT_EQ(request.headers().size(), 2u);
    EXPECT_EQ(request.headers().at("X-TRACE"), "2");
    EXPECT_EQ(request.headers().find("X-Trace")->first, "x-trace");
    EXPECT_TRUE(sameHeader("x-registry-auth", REGISTRY_AUTH_HEADER));
}

TEST(RequestTest, UnjoinablePathIsRejected) {
    EXPECT_THROW(makeRequest(DAEMON, Method::Get, "/containers/abc\n/json"), RequestBuildError);
}

TEST(RequestTest, UnixSocketUsesLocalhostBase) {
    auto endpoint = DaemonEndpoint::local("/var/run/docker.sock");
    auto request = makeRequest(endpoint, Method::Get, "/_ping");
    EXPECT_EQ(request.url(), "http://localhost/_ping");
    EXPECT_EQ(request.target(), "/_ping");
    EXPECT_EQ(request.endpoint().socketPath(), "/var/run/docker.sock");
}

TEST(RequestTest, DescribeRedactsCredentials) {
    auto request = makeRequest(DAEMON, Method::Post, "/images/create?fromImage=ubuntu", std::nullopt,
                               {{REGISTRY_AUTH_HEADER, "c2VjcmV0"}});
    std::string line = request.describe();
    EXPECT_NE(line.find("POST tcp://10.0.0.5:2375/images/create?fromImage=ubuntu"), std::string::npos);
    EXPECT_NE(line.find("<redacted>"), std::string::npos);
    EXPECT_EQ(line.find("c2VjcmV0"), std::string::npos);
}
