#include <gtest/gtest.h>

#include "lib/dockerClient.hpp"
#include "lib/errors.hpp"

using namespace Docker;

class ResourcesTest : public ::testing::Test {
protected:
    Client client{DaemonEndpoint::parse("tcp://10.0.0.5:2375")};

    static nlohmann::json body(const RequestDescriptor& request) {
        return nlohmann::json::parse(request.body().value().data);
    }
};

TEST_F(ResourcesTest, System) {
    EXPECT_EQ(client.version().url(), "tcp://10.0.0.5:2375/version");
    EXPECT_EQ(client.info().target(), "/info");
    EXPECT_EQ(client.ping().target(), "/_ping");
    EXPECT_EQ(client.events().target(), "/events");

    auto events = client.events(EventsOptionsBuilder().since(100).filter({EventFilter::type("container")}).build());
    EXPECT_EQ(events.method(), Method::Get);
    EXPECT_EQ(events.target(), "/events?filters=%7B%22type%22%3A%5B%22container%22%5D%7D&since=100");
}

TEST_F(ResourcesTest, Volumes) {
    auto volumes = client.volumes();
    EXPECT_EQ(volumes.list().target(), "/volumes");
    EXPECT_EQ(volumes.list(VolumeListOptionsBuilder().filter({VolumeFilter::dangling()}).build()).target(),
              "/volumes?filters=%7B%22dangling%22%3A%5B%22true%22%5D%7D");

    auto create = volumes.create(VolumeCreateOptionsBuilder().name("data").driver("local").labels({{"a", "b"}}).build());
    EXPECT_EQ(create.method(), Method::Post);
    EXPECT_EQ(create.target(), "/volumes/create");
    EXPECT_EQ(body(create), nlohmann::json({{"Name", "data"}, {"Driver", "local"}, {"Labels", {{"a", "b"}}}}));

    auto volume = volumes.get("data");
    EXPECT_EQ(volume.inspect().target(), "/volumes/data");
    EXPECT_EQ(volume.remove().method(), Method::Delete);
    EXPECT_EQ(volume.remove().target(), "/volumes/data");
    EXPECT_EQ(volume.remove(true).target(), "/volumes/data?force=true");
}

TEST_F(ResourcesTest, Networks) {
    auto networks = client.networks();
    EXPECT_EQ(networks.list(NetworkListOptionsBuilder().filter({NetworkFilter::driver("bridge")}).build()).target(),
              "/networks?filters=%7B%22driver%22%3A%5B%22bridge%22%5D%7D");

    auto create = networks.create(NetworkCreateOptionsBuilder("backend").driver("overlay").attachable(true).build());
    EXPECT_EQ(create.method(), Method::Post);
    EXPECT_EQ(create.target(), "/networks/create");
    EXPECT_EQ(body(create)["Name"], "backend");
    EXPECT_EQ(body(create)["Attachable"], true);

    auto network = networks.get("n1");
    EXPECT_EQ(network.inspect().target(), "/networks/n1");
    EXPECT_EQ(network.remove().method(), Method::Delete);
    EXPECT_EQ(network.remove().target(), "/networks/n1");

    auto connect = network.connect(ContainerConnectionOptionsBuilder("abc").aliases({"db"}).build());
    EXPECT_EQ(connect.method(), Method::Post);
    EXPECT_EQ(connect.target(), "/networks/n1/connect");
    EXPECT_EQ(body(connect)["Container"], "abc");
    EXPECT_EQ(body(connect)["EndpointConfig"]["Aliases"][0], "db");

    auto disconnect = network.disconnect(ContainerConnectionOptionsBuilder("abc").force(true).build());
    EXPECT_EQ(disconnect.target(), "/networks/n1/disconnect");
    EXPECT_EQ(body(disconnect), nlohmann::json({{"Container", "abc"}, {"Force", true}}));

    // The daemon reports a missing Container itself
    auto bare = ContainerConnectionOptionsBuilder::fromJson({{"Force", true}}).build();
    EXPECT_EQ(nlohmann::json::parse(bare.serialize()), nlohmann::json({{"Force", true}}));
    EXPECT_THROW(ContainerConnectionOptionsBuilder::fromJson(nlohmann::json::array()), RequestBuildError);
}

TEST_F(ResourcesTest, Services) {
    auto services = client.services();
    EXPECT_EQ(services.list(ServiceListOptionsBuilder().status(true).build()).target(), "/services?status=true");

    auto auth = RegistryAuth::token("abc");
    auto create = services.create(ServiceOptionsBuilder("web").image("nginx").replicas(2).auth(auth).build());
    EXPECT_EQ(create.method(), Method::Post);
    EXPECT_EQ(create.target(), "/services/create");
    EXPECT_EQ(create.headers().at("X-Registry-Auth"), auth.serialize());
    EXPECT_EQ(body(create)["TaskTemplate"]["ContainerSpec"]["Image"], "nginx");
    EXPECT_EQ(body(create)["Mode"]["Replicated"]["Replicas"], 2);

    auto service = services.get("s1");
    EXPECT_EQ(service.inspect().target(), "/services/s1");
    EXPECT_EQ(service.remove().method(), Method::Delete);
    EXPECT_EQ(service.remove().target(), "/services/s1");
    EXPECT_EQ(service.logs(LogsOptionsBuilder().stdout(true).build()).target(), "/services/s1/logs?stdout=true");

    auto update = service.update(7, ServiceOptionsBuilder("web").global().build());
    EXPECT_EQ(update.method(), Method::Post);
    EXPECT_EQ(update.target(), "/services/s1/update?version=7");
    EXPECT_EQ(update.headers().count("X-Registry-Auth"), 0u);
    EXPECT_TRUE(body(update)["Mode"].contains("Global"));
}

TEST_F(ResourcesTest, IdentifiersStayInsideTheirPath) {
    EXPECT_EQ(client.volumes().get("data?force=true").remove().target(), "/volumes/data%3Fforce%3Dtrue");
    EXPECT_EQ(client.networks().get("n1/disconnect").inspect().target(), "/networks/n1%2Fdisconnect");
    EXPECT_EQ(client.services().get("s1#frag").inspect().target(), "/services/s1%23frag");
    EXPECT_THROW(client.volumes().get("..").inspect(), RequestBuildError);
    EXPECT_THROW(client.networks().get(".").remove(), RequestBuildError);
    EXPECT_THROW(client.services().get("..").logs(), RequestBuildError);
}
