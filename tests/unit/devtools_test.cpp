#include <courier/fetch/devtools.h>
#include <courier/fetch/fetch_target.h>

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace courier;
using namespace courier::fetch;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// DevtoolsChannel
// ---------------------------------------------------------------------------

TEST(DevtoolsChannelTest, FifoOrder) {
    DevtoolsChannel channel;
    HttpRequestRecord request;
    request.method = "GET";
    channel.send(request);

    HttpResponseRecord response;
    response.status = HttpStatus{404, "Not Found"};
    channel.send(response);
    EXPECT_EQ(channel.pending(), 2u);

    auto first = channel.try_receive();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(std::holds_alternative<HttpRequestRecord>(*first));

    auto second = channel.try_receive();
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(std::holds_alternative<HttpResponseRecord>(*second));
    EXPECT_EQ(std::get<HttpResponseRecord>(*second).status->code, 404);

    EXPECT_FALSE(channel.try_receive().has_value());
    EXPECT_EQ(channel.pending(), 0u);
}

TEST(DevtoolsChannelTest, ReceiveTimesOut) {
    DevtoolsChannel channel;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.receive(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(DevtoolsChannelTest, ReceiveWakesOnSend) {
    DevtoolsChannel channel;
    std::thread producer([&channel]() {
        std::this_thread::sleep_for(10ms);
        HttpRequestRecord record;
        record.is_xhr = true;
        channel.send(record);
    });

    auto message = channel.receive(5000ms);
    producer.join();
    ASSERT_TRUE(message.has_value());
    EXPECT_TRUE(std::get<HttpRequestRecord>(*message).is_xhr);
}

// ---------------------------------------------------------------------------
// ResponseCollector
// ---------------------------------------------------------------------------

TEST(ResponseCollectorTest, CollectsChunksAndEof) {
    ResponseCollector collector;
    EXPECT_FALSE(collector.finished());
    EXPECT_FALSE(collector.wait_for(1ms).has_value());

    collector.process_response_chunk({'a', 'b'});
    collector.process_response_chunk({'c'});
    collector.process_response_eof(Response::network_error("late failure"));

    EXPECT_TRUE(collector.finished());
    EXPECT_EQ(collector.streamed_bytes(), (std::vector<uint8_t>{'a', 'b', 'c'}));
    EXPECT_EQ(collector.wait().termination_reason, "late failure");
}

TEST(ResponseCollectorTest, WaitBlocksUntilEof) {
    ResponseCollector collector;
    std::thread worker([&collector]() {
        std::this_thread::sleep_for(10ms);
        Response response;
        response.status = HttpStatus{201, "Created"};
        collector.process_response_eof(response);
    });

    Response response = collector.wait();
    worker.join();
    EXPECT_EQ(response.status->code, 201);
}
