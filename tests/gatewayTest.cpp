#include <gtest/gtest.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "directory.hpp"
#include "gateway.hpp"
#include "gatewayErrors.hpp"
#include "transport.hpp"

using Docker::DaemonEndpoint;
using Docker::Method;
using namespace std::chrono_literals;

namespace {
    // Records every request and answers with a canned response or failure.
    class RecordingTransport : public Gateway::Transport {
        mutable std::mutex mutex_;
        mutable std::vector<Docker::RequestDescriptor> sent_;

    public:
        Gateway::UpstreamResponse response{200, {{"Content-Type", "application/json"}, {"Content-Length", "2"}}, "[]"};
        std::optional<httplib::Error> failure;

        void stream(const Docker::RequestDescriptor& request, const Gateway::HeadHandler& onHead,
                    const Gateway::ChunkHandler& onChunk) const override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sent_.push_back(request);
            }
            if (failure) throw Gateway::TransportError("Daemon request failed", *failure, request.url());
            if (!onHead(response.status, response.headers)) return;
            if (!response.body.empty()) onChunk(response.body.data(), response.body.size());
        }

        std::vector<Docker::RequestDescriptor> sent() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_;
        }
    };
}

class GatewayTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
    std::unique_ptr<Gateway::Server> server;
    std::thread thread;
    int port = 0;

    void SetUp() override {
        auto directory = std::make_shared<Gateway::StaticDirectory>(std::map<std::string, DaemonEndpoint>{
            {"tenant-7", DaemonEndpoint::parse("tcp://10.0.0.5:2375")}
        });
        server = std::make_unique<Gateway::Server>(directory, transport);
        port = server->bindToAnyPort("127.0.0.1");
        thread = std::thread([this] { server->listenAfterBind(); });
        server->waitUntilReady();
    }

    void TearDown() override {
        server->stop();
        thread.join();
    }

    httplib::Client client() const {
        return httplib::Client("127.0.0.1", port);
    }

    Docker::RequestDescriptor onlyRequest() const {
        auto sent = transport->sent();
        EXPECT_EQ(sent.size(), 1u);
        return sent.at(0);
    }
};

TEST_F(GatewayTest, ForwardsToResolvedDaemon) {
    auto res = client().Get("/tenant-7/containers?all=true");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "[]");
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");

    auto request = onlyRequest();
    EXPECT_EQ(request.method(), Method::Get);
    EXPECT_EQ(request.url(), "tcp://10.0.0.5:2375/containers/json?all=true");
}

TEST_F(GatewayTest, UnknownTenantNeverReachesTransport) {
    auto res = client().Get("/tenant-x/containers");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["path"], "/tenant-x/containers");
    EXPECT_NE(body["message"].get<std::string>().find("tenant-x"), std::string::npos);
    EXPECT_TRUE(transport->sent().empty());
}

TEST_F(GatewayTest, StopMapsWaitToGracePeriod) {
    auto res = client().Post("/tenant-7/containers/abc/stop?wait=30", "", "text/plain");
    ASSERT_TRUE(res);
    auto request = onlyRequest();
    EXPECT_EQ(request.method(), Method::Post);
    EXPECT_EQ(request.target(), "/containers/abc/stop?t=30");
}

TEST_F(GatewayTest, RemoveUsesDelete) {
    auto res = client().Delete("/tenant-7/containers/abc?force=true");
    ASSERT_TRUE(res);
    auto request = onlyRequest();
    EXPECT_EQ(request.method(), Method::Delete);
    EXPECT_EQ(request.target(), "/containers/abc?force=true");
}

TEST_F(GatewayTest, CreatePassesBodyAndName) {
    auto res = client().Post("/tenant-7/containers?name=web", R"({"Image":"nginx","Tty":true})", "application/json");
    ASSERT_TRUE(res);
    auto request = onlyRequest();
    EXPECT_EQ(request.target(), "/containers/create?name=web");
    auto body = nlohmann::json::parse(request.body().value().data);
    EXPECT_EQ(body["Image"], "nginx");
    EXPECT_EQ(body["Tty"], true);
}

TEST_F(GatewayTest, FiltersArePassedAsJson) {
    auto res = client().Get("/tenant-7/images?filters=%7B%22dangling%22%3A%5B%22true%22%5D%7D");
    ASSERT_TRUE(res);
    EXPECT_EQ(onlyRequest().target(), "/images/json?filters=%7B%22dangling%22%3A%5B%22true%22%5D%7D");
}

TEST_F(GatewayTest, MalformedInputIsRejectedBeforeForwarding) {
    auto badFilters = client().Get("/tenant-7/containers?filters=notjson");
    ASSERT_TRUE(badFilters);
    EXPECT_EQ(badFilters->status, 400);

    auto badFlag = client().Get("/tenant-7/containers?all=perhaps");
    ASSERT_TRUE(badFlag);
    EXPECT_EQ(badFlag->status, 400);

    auto badBody = client().Post("/tenant-7/volumes", "{", "application/json");
    ASSERT_TRUE(badBody);
    EXPECT_EQ(badBody->status, 400);

    auto missingName = client().Post("/tenant-7/containers/abc/rename", "", "text/plain");
    ASSERT_TRUE(missingName);
    EXPECT_EQ(missingName->status, 400);
    EXPECT_EQ(nlohmann::json::parse(missingName->body)["path"], "/tenant-7/containers/abc/rename");

    EXPECT_TRUE(transport->sent().empty());
}

TEST_F(GatewayTest, ImageNamesMayContainSlashes) {
    auto res = client().Get("/tenant-7/images/library%2Fubuntu/history");
    ASSERT_TRUE(res);
    EXPECT_EQ(onlyRequest().target(), "/images/library/ubuntu/history");
}

TEST_F(GatewayTest, DecodedIdentifiersCannotRewriteTheDaemonPath) {
    auto smuggledQuery = client().Delete("/tenant-7/containers/abc%3Fforce%3Dtrue");
    ASSERT_TRUE(smuggledQuery);
    auto request = onlyRequest();
    EXPECT_EQ(request.method(), Method::Delete);
    EXPECT_EQ(request.target(), "/containers/abc%3Fforce%3Dtrue");

    auto traversal = client().Delete("/tenant-7/images/..%2Fcontainers%2Fabc");
    ASSERT_TRUE(traversal);
    EXPECT_EQ(traversal->status, 400);
    EXPECT_EQ(transport->sent().size(), 1u);
}

TEST_F(GatewayTest, SearchLimitMustFitAnInt) {
    auto tooLarge = client().Get("/tenant-7/images/search?term=nginx&limit=99999999999");
    ASSERT_TRUE(tooLarge);
    EXPECT_EQ(tooLarge->status, 400);

    auto negative = client().Get("/tenant-7/images/search?term=nginx&limit=-1");
    ASSERT_TRUE(negative);
    EXPECT_EQ(negative->status, 400);
    EXPECT_TRUE(transport->sent().empty());

    auto ok = client().Get("/tenant-7/images/search?term=nginx&limit=5");
    ASSERT_TRUE(ok);
    EXPECT_EQ(onlyRequest().target(), "/images/search?term=nginx&limit=5");
}

TEST_F(GatewayTest, ResponsesAllowAnyOrigin) {
    auto res = client().Get("/tenant-7/info");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "GET, POST, PUT, DELETE, OPTIONS");
    EXPECT_FALSE(res->has_header("Access-Control-Allow-Credentials"));

    auto missing = client().Get("/tenant-x/info");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
    EXPECT_EQ(missing->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(GatewayTest, PreflightIsAnsweredLocally) {
    httplib::Headers headers = {
        {"Origin", "http://console.local"},
        {"Access-Control-Request-Method", "DELETE"},
        {"Access-Control-Request-Headers", "X-Registry-Auth"}
    };
    auto res = client().Options("/tenant-7/containers/abc", headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "GET, POST, PUT, DELETE, OPTIONS");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "X-Registry-Auth");
    EXPECT_TRUE(transport->sent().empty());
}

TEST_F(GatewayTest, RegistryCredentialsAreForwarded) {
    auto auth = Docker::RegistryAuth::token("abc").serialize();
    httplib::Headers headers = {{"X-Registry-Auth", auth}};
    auto res = client().Post("/tenant-7/images/pull?fromImage=ubuntu&tag=22.04", headers, "", "text/plain");
    ASSERT_TRUE(res);
    auto request = onlyRequest();
    EXPECT_EQ(request.target(), "/images/create?fromImage=ubuntu&tag=22.04");
    EXPECT_EQ(request.headers().at("X-Registry-Auth"), auth);
}

TEST_F(GatewayTest, DaemonErrorsAreRelayedUnchanged) {
    transport->response = {409, {{"Content-Type", "application/json"}}, R"({"message":"conflict"})"};
    auto res = client().Post("/tenant-7/containers/abc/start", "", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 409);
    EXPECT_EQ(res->body, R"({"message":"conflict"})");
}

TEST_F(GatewayTest, TransportFailuresBecomeGatewayErrors) {
    transport->failure = httplib::Error::Connection;
    auto refused = client().Get("/tenant-7/info");
    ASSERT_TRUE(refused);
    EXPECT_EQ(refused->status, 502);

    transport->failure = httplib::Error::Read;
    auto slow = client().Get("/tenant-7/info");
    ASSERT_TRUE(slow);
    EXPECT_EQ(slow->status, 504);
    EXPECT_EQ(transport->sent().size(), 2u);
}

TEST(GatewayRealTransportTest, UnreachableDaemonAnswersBadGateway) {
    auto directory = std::make_shared<Gateway::StaticDirectory>(std::map<std::string, DaemonEndpoint>{},
                                                                DaemonEndpoint::parse("tcp://127.0.0.1:1"));
    auto transport = std::make_shared<Gateway::HttplibTransport>(std::chrono::seconds(2), std::chrono::seconds(2));
    Gateway::Server server(directory, transport);
    int port = server.bindToAnyPort("127.0.0.1");
    std::thread thread([&server] { server.listenAfterBind(); });
    server.waitUntilReady();

    httplib::Client client("127.0.0.1", port);
    auto res = client.Get("/anyone/ping");
    server.stop();
    thread.join();

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 502);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["path"], "/anyone/ping");
    EXPECT_NE(body["message"].get<std::string>().find("tcp://127.0.0.1:1/_ping"), std::string::npos);
}

namespace {
    // Answers stats as an endless stream, one line every few milliseconds.
    class StreamingDaemon {
        httplib::Server server_;
        std::thread thread_;
        std::atomic<bool> stopping_{false};

    public:
        int port = 0;

        StreamingDaemon() {
            server_.Get("/containers/abc/stats", [this](const httplib::Request&, httplib::Response& res) {
                res.set_chunked_content_provider("application/json", [this](size_t, httplib::DataSink& sink) {
                    if (stopping_) return false;
                    const std::string line = "{\"read\":\"tick\"}\n";
                    if (!sink.write(line.data(), line.size())) return false;
                    std::this_thread::sleep_for(20ms);
                    return true;
                });
            });
            port = server_.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this] { server_.listen_after_bind(); });
            server_.wait_until_ready();
        }

        ~StreamingDaemon() {
            stopping_ = true;
            server_.stop();
            thread_.join();
        }
    };
}

TEST(GatewayStreamingTest, EndlessBodiesReachTheCallerAsTheyArrive) {
    StreamingDaemon daemon;
    auto directory = std::make_shared<Gateway::StaticDirectory>(std::map<std::string, DaemonEndpoint>{
        {"tenant-7", DaemonEndpoint::tcp("127.0.0.1", daemon.port)}
    });
    auto transport = std::make_shared<Gateway::HttplibTransport>(2s, 5s);
    Gateway::Server server(directory, transport);
    int port = server.bindToAnyPort("127.0.0.1");
    std::thread thread([&server] { server.listenAfterBind(); });
    server.waitUntilReady();

    int status = 0;
    std::string received;
    {
        httplib::Client client("127.0.0.1", port);
        client.set_read_timeout(5s);
        client.Get("/tenant-7/containers/abc/stats",
            [&status](const httplib::Response& response) {
                status = response.status;
                return true;
            },
            [&received](const char* data, size_t length) {
                received.append(data, length);
                return received.find('\n') == std::string::npos;
            });
    }
    server.stop();
    thread.join();

    EXPECT_EQ(status, 200);
    EXPECT_EQ(received.substr(0, received.find('\n')), R"({"read":"tick"})");
}
