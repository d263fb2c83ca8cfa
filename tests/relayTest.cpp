#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

#include "gatewayErrors.hpp"
#include "lib/dockerClient.hpp"
#include "relay.hpp"

using Gateway::ResponsePipe;
using namespace std::chrono_literals;

TEST(ResponsePipeTest, HeadThenBodyThenEnd) {
    ResponsePipe pipe(1024);
    EXPECT_TRUE(pipe.head(200, {{"Content-Type", "text/plain"}}));
    EXPECT_TRUE(pipe.push("ab", 2));
    EXPECT_TRUE(pipe.push("cd", 2));
    pipe.finish();

    EXPECT_EQ(pipe.waitForHead({}, 10ms), ResponsePipe::Wait::head);
    EXPECT_EQ(pipe.status(), 200);

    std::string out;
    EXPECT_EQ(pipe.pull(out, 10ms), ResponsePipe::Pull::data);
    EXPECT_EQ(out, "abcd");
    EXPECT_EQ(pipe.pull(out, 10ms), ResponsePipe::Pull::end);
    EXPECT_FALSE(pipe.error());
}

TEST(ResponsePipeTest, IdleUntilSomethingArrives) {
    ResponsePipe pipe(1024);
    std::string out;
    EXPECT_EQ(pipe.pull(out, 10ms), ResponsePipe::Pull::idle);
}

TEST(ResponsePipeTest, ProducerWaitsForReaderAtLimit) {
    ResponsePipe pipe(4);
    ASSERT_TRUE(pipe.push("1234", 4));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        pipe.push("5678", 4);
        pushed = true;
    });
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());

    std::string out;
    EXPECT_EQ(pipe.pull(out, 1s), ResponsePipe::Pull::data);
    EXPECT_EQ(out, "1234");
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(pipe.pull(out, 1s), ResponsePipe::Pull::data);
    EXPECT_EQ(out, "5678");
}

TEST(ResponsePipeTest, CloseReleasesBlockedProducer) {
    ResponsePipe pipe(1);
    ASSERT_TRUE(pipe.push("x", 1));

    std::atomic<bool> accepted{true};
    std::thread producer([&] { accepted = pipe.push("y", 1); });
    pipe.close();
    producer.join();

    EXPECT_FALSE(accepted.load());
    EXPECT_FALSE(pipe.head(200, {}));
}

TEST(ResponsePipeTest, CancelledWhileWaitingForHead) {
    ResponsePipe pipe(16);
    int polls = 0;
    auto wait = pipe.waitForHead([&polls] { return ++polls == 3; }, 1ms);
    EXPECT_EQ(wait, ResponsePipe::Wait::cancelled);
    EXPECT_EQ(polls, 3);
}

TEST(ResponsePipeTest, FailureBeforeHeadIsKept) {
    ResponsePipe pipe(16);
    pipe.finish(std::make_exception_ptr(Gateway::TransportError("refused", httplib::Error::Connection, "tcp://x:1/_ping")));
    EXPECT_EQ(pipe.waitForHead({}, 10ms), ResponsePipe::Wait::finished);
    ASSERT_TRUE(pipe.error());
    EXPECT_THROW(std::rethrow_exception(pipe.error()), Gateway::TransportError);
}

TEST(UpstreamExchangeTest, TransportFailureIsHandedToReader) {
    struct FailingTransport : Gateway::Transport {
        void stream(const Docker::RequestDescriptor& request, const Gateway::HeadHandler&,
                    const Gateway::ChunkHandler&) const override {
            throw Gateway::TransportError("refused", httplib::Error::Connection, request.url());
        }
    };
    auto request = Docker::Client(Docker::DaemonEndpoint::parse("tcp://10.0.0.5:2375")).ping();
    Gateway::UpstreamExchange exchange(std::make_shared<FailingTransport>(), request, 16);

    EXPECT_EQ(exchange.pipe().waitForHead({}, 10ms), ResponsePipe::Wait::finished);
    exchange.join(false);
    EXPECT_THROW(std::rethrow_exception(exchange.pipe().error()), Gateway::TransportError);
}
